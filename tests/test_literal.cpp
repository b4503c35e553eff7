#include <strata/parser/literal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using strata::parser::LiteralKind;

TEST_CASE("Parse list of quoted strings", "[parser][literal]") {
    auto result = strata::parser::parse_literal("['facebook', \"instagram\"]");
    REQUIRE(result.has_value());
    REQUIRE(result->kind == LiteralKind::List);
    REQUIRE(result->items.size() == 2);
    REQUIRE(result->items[0].text == "facebook");
    REQUIRE(result->items[1].text == "instagram");
}

TEST_CASE("Parse mapping and set literals", "[parser][literal]") {
    SECTION("mapping keeps key order") {
        auto result = strata::parser::parse_literal("{'b': 1, 'a': [2, 3]}");
        REQUIRE(result.has_value());
        REQUIRE(result->kind == LiteralKind::Mapping);
        REQUIRE(result->entries.size() == 2);
        REQUIRE(result->entries[0].first.text == "b");
        REQUIRE(result->entries[1].second.kind == LiteralKind::List);
    }

    SECTION("braces without colons form a set") {
        auto result = strata::parser::parse_literal("{'x', 'y'}");
        REQUIRE(result.has_value());
        REQUIRE(result->kind == LiteralKind::Set);
        REQUIRE(result->items.size() == 2);
    }

    SECTION("empty braces are an empty mapping") {
        auto result = strata::parser::parse_literal("{}");
        REQUIRE(result.has_value());
        REQUIRE(result->kind == LiteralKind::Mapping);
        REQUIRE(result->entries.empty());
    }
}

TEST_CASE("Parse scalars and escapes", "[parser][literal]") {
    auto result = strata::parser::parse_literal("[1, -2.5e3, True, None, 'it\\'s', null]");
    REQUIRE(result.has_value());
    REQUIRE(result->items.size() == 6);
    REQUIRE(result->items[0].kind == LiteralKind::Number);
    REQUIRE(result->items[1].text == "-2.5e3");
    REQUIRE(result->items[2].kind == LiteralKind::Bool);
    REQUIRE(result->items[3].kind == LiteralKind::Null);
    REQUIRE(result->items[4].text == "it's");
    REQUIRE(result->items[5].kind == LiteralKind::Null);
}

TEST_CASE("Trailing commas and whitespace are accepted", "[parser][literal]") {
    auto result = strata::parser::parse_literal("  [ 'a' ,\n 'b', ]  ");
    REQUIRE(result.has_value());
    REQUIRE(result->items.size() == 2);
}

TEST_CASE("Malformed literals report an error", "[parser][literal]") {
    for (const char* text : {"['a', 'b'", "['a' 'b']", "[foo]", "{'a': }", "['a'] x", "", "[1.]e"}) {
        INFO(text);
        auto result = strata::parser::parse_literal(text);
        REQUIRE_FALSE(result.has_value());
        REQUIRE_FALSE(result.error().message.empty());
    }
}

TEST_CASE("Error offset points at the failure", "[parser][literal]") {
    auto result = strata::parser::parse_literal("['a' 'b']");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().offset == 5);
    REQUIRE(result.error().format() == "expected ',' or ']' at offset 5");
}

TEST_CASE("Container detection", "[parser][literal]") {
    REQUIRE(strata::parser::is_container_literal("['fb', 'ig']"));
    REQUIRE(strata::parser::is_container_literal("{\"a\": 1}"));
    REQUIRE(strata::parser::is_container_literal(" [] "));
    REQUIRE_FALSE(strata::parser::is_container_literal("(1, 2)"));
    REQUIRE_FALSE(strata::parser::is_container_literal("[broken"));
    REQUIRE_FALSE(strata::parser::is_container_literal("[not valid]"));
    REQUIRE_FALSE(strata::parser::is_container_literal("plain"));
    REQUIRE_FALSE(strata::parser::is_container_literal("42"));
}

TEST_CASE("Explode yields one token per element", "[parser][literal]") {
    SECTION("list elements") {
        auto tokens = strata::parser::parse_tokens("[\"fb\",\"ig\"]");
        REQUIRE(tokens.has_value());
        REQUIRE(*tokens == std::vector<std::string>{"fb", "ig"});
    }

    SECTION("duplicates are kept") {
        auto tokens = strata::parser::parse_tokens("['fb', 'fb']");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->size() == 2);
    }

    SECTION("mapping keys") {
        auto tokens = strata::parser::parse_tokens("{'a': 1, 'b': 2}");
        REQUIRE(tokens.has_value());
        REQUIRE(*tokens == std::vector<std::string>{"a", "b"});
    }

    SECTION("nested containers become canonical text") {
        auto tokens = strata::parser::parse_tokens("[['x', 1], 2]");
        REQUIRE(tokens.has_value());
        REQUIRE(*tokens == std::vector<std::string>{"['x', 1]", "2"});
    }

    SECTION("empty list yields nothing") {
        auto tokens = strata::parser::parse_tokens("[]");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->empty());
    }

    SECTION("scalars are not lists") {
        REQUIRE_FALSE(strata::parser::parse_tokens("'fb'").has_value());
        REQUIRE_FALSE(strata::parser::parse_tokens("fb").has_value());
    }
}

TEST_CASE("String escapes decode to UTF-8", "[parser][literal]") {
    auto tokens = strata::parser::parse_tokens(R"(['caf\xe9', 'été', '\U0001F600', '\0', 'a\tb'])");
    REQUIRE(tokens.has_value());
    REQUIRE(tokens->size() == 5);
    REQUIRE((*tokens)[0] == "caf\xc3\xa9");
    REQUIRE((*tokens)[1] == "\xc3\xa9t\xc3\xa9");
    REQUIRE((*tokens)[2] == "\xf0\x9f\x98\x80");
    REQUIRE((*tokens)[3] == std::string(1, '\0'));
    REQUIRE((*tokens)[4] == "a\tb");

    SECTION("decoded and literal spellings count as one token") {
        auto plain = strata::parser::parse_tokens("['caf\xc3\xa9']");
        REQUIRE(plain.has_value());
        REQUIRE(plain->front() == (*tokens)[0]);
    }

    SECTION("truncated escapes are errors") {
        REQUIRE_FALSE(strata::parser::parse_literal(R"('\x4')").has_value());
        REQUIRE_FALSE(strata::parser::parse_literal(R"('\u12')").has_value());
    }

    SECTION("unknown escapes keep their backslash") {
        auto result = strata::parser::parse_literal(R"('\q')");
        REQUIRE(result.has_value());
        REQUIRE(result->text == "\\q");
    }
}

TEST_CASE("String prefixes", "[parser][literal]") {
    auto unicode = strata::parser::parse_tokens("[u'facebook', U\"ig\"]");
    REQUIRE(unicode.has_value());
    REQUIRE(*unicode == std::vector<std::string>{"facebook", "ig"});

    auto raw = strata::parser::parse_literal(R"(r'a\nb\'c')");
    REQUIRE(raw.has_value());
    REQUIRE(raw->text == R"(a\nb\'c)");

    REQUIRE_FALSE(strata::parser::parse_literal("b'bytes'").has_value());
}
