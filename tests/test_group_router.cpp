#include <strata/runtime/group_router.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using strata::core::ColumnType;
using namespace strata::runtime;

namespace {

auto make_types() -> ColumnTypes {
    return ColumnTypes{{"country", "spend", "tag"},
                       {ColumnType::Categorical, ColumnType::Numeric, ColumnType::Categorical}};
}

auto numeric_count(const AccumulatorSet& set, std::size_t idx) -> std::uint64_t {
    return std::get<strata::core::NumericAccumulator>(set.at(idx)).count();
}

}  // namespace

TEST_CASE("Grouping columns are not measured", "[runtime][router]") {
    GroupRouter router(make_types(), {0});
    REQUIRE(router.measured_columns() == std::vector<std::size_t>{1, 2});
    REQUIRE(router.group_columns() == std::vector<std::size_t>{0});

    GroupRouter ungrouped(make_types(), {});
    REQUIRE(ungrouped.measured_columns().size() == 3);
}

TEST_CASE("Route creates a group once and reuses it", "[runtime][router]") {
    GroupRouter router(make_types(), {0});

    auto& us = router.route({"US"});
    REQUIRE(us.size() == 2);
    REQUIRE(strata::core::type_of(us[0]) == ColumnType::Numeric);
    REQUIRE(strata::core::type_of(us[1]) == ColumnType::Categorical);
    strata::core::ingest(us[0], "5");

    strata::core::ingest(router.route({"FR"})[0], "100");
    strata::core::ingest(router.route({"US"})[0], "15");

    REQUIRE(router.size() == 2);
    REQUIRE(router.groups()[0].key == GroupKey{"US"});
    REQUIRE(router.groups()[1].key == GroupKey{"FR"});

    const auto* found = router.find({"US"});
    REQUIRE(found != nullptr);
    REQUIRE(numeric_count(*found, 0) == 2);
    REQUIRE(router.find({"DE"}) == nullptr);
}

TEST_CASE("Composite keys compare element-wise", "[runtime][router]") {
    GroupRouter router(make_types(), {0, 2});

    static_cast<void>(router.route({"US", "a"}));
    static_cast<void>(router.route({"US", "b"}));
    static_cast<void>(router.route({"US", "a"}));
    static_cast<void>(router.route({"USa", ""}));

    REQUIRE(router.size() == 3);
    REQUIRE(GroupKeyHash{}(GroupKey{"x", "y"}) == GroupKeyHash{}(GroupKey{"x", "y"}));
}

TEST_CASE("Router merge unions keys and merges shared groups", "[runtime][router]") {
    GroupRouter left(make_types(), {0});
    GroupRouter right(make_types(), {0});

    strata::core::ingest(left.route({"US"})[0], "5");
    strata::core::ingest(right.route({"FR"})[0], "100");
    strata::core::ingest(right.route({"US"})[0], "15");

    left.merge(right);
    REQUIRE(left.size() == 2);
    REQUIRE(left.groups()[0].key == GroupKey{"US"});
    REQUIRE(left.groups()[1].key == GroupKey{"FR"});
    REQUIRE(numeric_count(*left.find({"US"}), 0) == 2);
    REQUIRE(numeric_count(*left.find({"FR"}), 0) == 1);
}

TEST_CASE("Router rejects incompatible layouts", "[runtime][router]") {
    GroupRouter a(make_types(), {0});
    GroupRouter b(make_types(), {2});
    REQUIRE_THROWS_AS(a.merge(b), std::logic_error);
    REQUIRE_THROWS_AS(GroupRouter(make_types(), {7}), std::out_of_range);
}
