#include <strata/parser/literal.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <optional>

namespace strata::parser {

namespace {

void append_utf8(std::string& out, std::uint32_t code) {
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

class LiteralParser {
   public:
    explicit LiteralParser(std::string_view source) : source_(source) {}

    auto parse() -> LiteralResult {
        skip_whitespace();
        auto value = parse_value(0);
        if (!value) {
            return value;
        }
        skip_whitespace();
        if (!at_end()) {
            return fail("unexpected trailing input");
        }
        return value;
    }

   private:
    static constexpr std::size_t kMaxDepth = 64;

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= source_.size(); }

    [[nodiscard]] auto peek() const -> char { return at_end() ? '\0' : source_[pos_]; }

    void skip_whitespace() {
        while (!at_end()) {
            char ch = peek();
            if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n') {
                break;
            }
            ++pos_;
        }
    }

    auto fail(std::string message) const -> std::unexpected<LiteralError> {
        return std::unexpected(LiteralError{.message = std::move(message), .offset = pos_});
    }

    auto parse_value(std::size_t depth) -> LiteralResult {
        if (depth > kMaxDepth) {
            return fail("literal nested too deeply");
        }
        if (at_end()) {
            return fail("unexpected end of input");
        }
        char ch = peek();
        switch (ch) {
            case '[':
                return parse_sequence(LiteralKind::List, ']', depth);
            case '(':
                return parse_sequence(LiteralKind::Tuple, ')', depth);
            case '{':
                return parse_braced(depth);
            case '\'':
            case '"':
                return parse_string(false);
            default:
                break;
        }
        if (auto prefix = string_prefix()) {
            pos_ += 1;
            return parse_string(*prefix == 'r' || *prefix == 'R');
        }
        if (ch == '-' || ch == '+' || ch == '.' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        if (std::isalpha(static_cast<unsigned char>(ch)) != 0) {
            return parse_word();
        }
        return fail(fmt::format("unexpected character '{}'", ch));
    }

    auto parse_sequence(LiteralKind kind, char close, std::size_t depth) -> LiteralResult {
        Literal out;
        out.kind = kind;
        ++pos_;
        skip_whitespace();
        while (true) {
            if (at_end()) {
                return fail(fmt::format("expected '{}'", close));
            }
            if (peek() == close) {
                ++pos_;
                return out;
            }
            auto item = parse_value(depth + 1);
            if (!item) {
                return item;
            }
            out.items.push_back(std::move(*item));
            skip_whitespace();
            if (peek() == ',') {
                ++pos_;
                skip_whitespace();
                continue;
            }
            if (peek() != close) {
                return fail(fmt::format("expected ',' or '{}'", close));
            }
        }
    }

    // `{}` is an empty mapping; `{a, b}` a set; `{k: v}` a mapping.
    auto parse_braced(std::size_t depth) -> LiteralResult {
        Literal out;
        out.kind = LiteralKind::Mapping;
        ++pos_;
        skip_whitespace();
        if (peek() == '}') {
            ++pos_;
            return out;
        }
        bool first = true;
        while (true) {
            auto key = parse_value(depth + 1);
            if (!key) {
                return key;
            }
            skip_whitespace();
            if (first) {
                out.kind = peek() == ':' ? LiteralKind::Mapping : LiteralKind::Set;
                first = false;
            }
            if (out.kind == LiteralKind::Mapping) {
                if (peek() != ':') {
                    return fail("expected ':' in mapping");
                }
                ++pos_;
                skip_whitespace();
                auto value = parse_value(depth + 1);
                if (!value) {
                    return value;
                }
                out.entries.emplace_back(std::move(*key), std::move(*value));
                skip_whitespace();
            } else {
                out.items.push_back(std::move(*key));
            }
            if (peek() == ',') {
                ++pos_;
                skip_whitespace();
                if (peek() == '}') {
                    ++pos_;
                    return out;
                }
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return out;
            }
            return fail("expected ',' or '}'");
        }
    }

    // `u'..'` and `r'..'`; other prefixes (bytes, f-strings) are not literals here.
    [[nodiscard]] auto string_prefix() const -> std::optional<char> {
        if (pos_ + 1 >= source_.size()) {
            return std::nullopt;
        }
        const char ch = source_[pos_];
        const char next = source_[pos_ + 1];
        if ((ch == 'u' || ch == 'U' || ch == 'r' || ch == 'R') && (next == '\'' || next == '"')) {
            return ch;
        }
        return std::nullopt;
    }

    auto parse_hex(std::size_t digits, std::uint32_t& out) -> bool {
        if (pos_ + digits > source_.size()) {
            return false;
        }
        out = 0;
        for (std::size_t i = 0; i < digits; ++i) {
            const char ch = source_[pos_ + i];
            out <<= 4;
            if (ch >= '0' && ch <= '9') {
                out |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                out |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                out |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                return false;
            }
        }
        pos_ += digits;
        return true;
    }

    auto parse_string(bool raw) -> LiteralResult {
        const char quote = source_[pos_++];
        Literal out;
        out.kind = LiteralKind::String;
        while (true) {
            if (at_end()) {
                return fail("unterminated string");
            }
            char ch = source_[pos_++];
            if (ch == quote) {
                return out;
            }
            if (ch != '\\') {
                out.text.push_back(ch);
                continue;
            }
            if (at_end()) {
                return fail("unterminated escape");
            }
            char esc = source_[pos_++];
            if (raw) {
                out.text.push_back('\\');
                out.text.push_back(esc);
                continue;
            }
            std::uint32_t code = 0;
            switch (esc) {
                case 'n':
                    out.text.push_back('\n');
                    break;
                case 't':
                    out.text.push_back('\t');
                    break;
                case 'r':
                    out.text.push_back('\r');
                    break;
                case 'a':
                    out.text.push_back('\a');
                    break;
                case 'b':
                    out.text.push_back('\b');
                    break;
                case 'f':
                    out.text.push_back('\f');
                    break;
                case 'v':
                    out.text.push_back('\v');
                    break;
                case '\n':
                    // Line continuation.
                    break;
                case '\\':
                case '\'':
                case '"':
                    out.text.push_back(esc);
                    break;
                case 'x':
                    if (!parse_hex(2, code)) {
                        return fail("truncated \\xXX escape");
                    }
                    append_utf8(out.text, code);
                    break;
                case 'u':
                    if (!parse_hex(4, code)) {
                        return fail("truncated \\uXXXX escape");
                    }
                    append_utf8(out.text, code);
                    break;
                case 'U':
                    if (!parse_hex(8, code) || code > 0x10FFFF) {
                        return fail("invalid \\UXXXXXXXX escape");
                    }
                    append_utf8(out.text, code);
                    break;
                default:
                    if (esc >= '0' && esc <= '7') {
                        code = static_cast<std::uint32_t>(esc - '0');
                        for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; ++i) {
                            code = code * 8 + static_cast<std::uint32_t>(source_[pos_++] - '0');
                        }
                        append_utf8(out.text, code);
                        break;
                    }
                    // Unknown escapes, \N{...} included, keep their backslash.
                    out.text.push_back('\\');
                    out.text.push_back(esc);
                    break;
            }
        }
    }

    auto parse_number() -> LiteralResult {
        const std::size_t start = pos_;
        if (peek() == '-' || peek() == '+') {
            ++pos_;
        }
        bool digits = false;
        while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
            digits = true;
        }
        if (peek() == '.') {
            ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                ++pos_;
                digits = true;
            }
        }
        if (!digits) {
            return fail("malformed number");
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                return fail("malformed exponent");
            }
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                ++pos_;
            }
        }
        Literal out;
        out.kind = LiteralKind::Number;
        out.text = std::string(source_.substr(start, pos_ - start));
        return out;
    }

    auto parse_word() -> LiteralResult {
        const std::size_t start = pos_;
        while (std::isalnum(static_cast<unsigned char>(peek())) != 0 || peek() == '_') {
            ++pos_;
        }
        std::string_view word = source_.substr(start, pos_ - start);
        Literal out;
        out.text = std::string(word);
        if (word == "True" || word == "False" || word == "true" || word == "false") {
            out.kind = LiteralKind::Bool;
            return out;
        }
        if (word == "None" || word == "null") {
            out.kind = LiteralKind::Null;
            return out;
        }
        pos_ = start;
        return fail(fmt::format("unknown name '{}'", word));
    }

    std::string_view source_;
    std::size_t pos_ = 0;
};

auto quote(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char ch : text) {
        if (ch == '\'' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('\'');
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto Literal::to_text() const -> std::string {
    auto join = [](const std::vector<Literal>& items) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out.append(", ");
            }
            out.append(items[i].kind == LiteralKind::String ? quote(items[i].text)
                                                            : items[i].to_text());
        }
        return out;
    };
    switch (kind) {
        case LiteralKind::String:
        case LiteralKind::Number:
        case LiteralKind::Bool:
        case LiteralKind::Null:
            return text;
        case LiteralKind::List:
            return "[" + join(items) + "]";
        case LiteralKind::Tuple:
            return items.size() == 1 ? "(" + join(items) + ",)" : "(" + join(items) + ")";
        case LiteralKind::Set:
            return "{" + join(items) + "}";
        case LiteralKind::Mapping: {
            std::string out = "{";
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) {
                    out.append(", ");
                }
                const auto& [key, value] = entries[i];
                out.append(key.kind == LiteralKind::String ? quote(key.text) : key.to_text());
                out.append(": ");
                out.append(value.kind == LiteralKind::String ? quote(value.text)
                                                             : value.to_text());
            }
            out.push_back('}');
            return out;
        }
    }
    return text;
}

auto LiteralError::format() const -> std::string {
    return fmt::format("{} at offset {}", message, offset);
}

auto parse_literal(std::string_view text) -> LiteralResult {
    LiteralParser parser(text);
    return parser.parse();
}

auto is_container_literal(std::string_view text) -> bool {
    auto trimmed = trim(text);
    if (trimmed.size() < 2) {
        return false;
    }
    const char open = trimmed.front();
    const char close = trimmed.back();
    if (!((open == '[' && close == ']') || (open == '{' && close == '}'))) {
        return false;
    }
    return parse_literal(trimmed).has_value();
}

auto explode(const Literal& literal) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    switch (literal.kind) {
        case LiteralKind::List:
        case LiteralKind::Tuple:
        case LiteralKind::Set:
            tokens.reserve(literal.items.size());
            for (const auto& item : literal.items) {
                tokens.push_back(item.to_text());
            }
            break;
        case LiteralKind::Mapping:
            tokens.reserve(literal.entries.size());
            for (const auto& entry : literal.entries) {
                tokens.push_back(entry.first.to_text());
            }
            break;
        default:
            tokens.push_back(literal.to_text());
            break;
    }
    return tokens;
}

auto parse_tokens(std::string_view text) -> std::expected<std::vector<std::string>, LiteralError> {
    auto trimmed = trim(text);
    if (trimmed.empty() || (trimmed.front() != '[' && trimmed.front() != '{')) {
        return std::unexpected(LiteralError{.message = "not a list or mapping literal", .offset = 0});
    }
    auto literal = parse_literal(trimmed);
    if (!literal) {
        return std::unexpected(literal.error());
    }
    return explode(*literal);
}

}  // namespace strata::parser
