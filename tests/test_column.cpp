#include <drain/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("Column<int64> basic operations", "[core][column]") {
    drain::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col[0] == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col[5] == 6);
    }

    SECTION("iteration visits every element in order") {
        std::vector<std::int64_t> seen(col.begin(), col.end());
        REQUIRE(seen == std::vector<std::int64_t>{1, 2, 3, 4, 5});
    }
}

TEST_CASE("Column append keeps order", "[core][column]") {
    drain::Column<std::string> lhs{"a", "b"};
    drain::Column<std::string> rhs{"c"};

    lhs.append(rhs);

    REQUIRE(lhs == drain::Column<std::string>{"a", "b", "c"});
}

TEST_CASE("Column take gathers rows", "[core][column]") {
    drain::Column<double> col{1.5, 2.5, 3.5, 4.5};
    std::vector<std::size_t> rows{3, 0, 3};

    auto taken = col.take(rows);

    REQUIRE(taken.size() == 3);
    REQUIRE(taken[0] == 4.5);
    REQUIRE(taken[1] == 1.5);
    REQUIRE(taken[2] == 4.5);
}

TEST_CASE("Column filled broadcasts a value", "[core][column]") {
    auto col = drain::Column<std::string>::filled(3, "x");

    REQUIRE(col.size() == 3);
    for (const auto& v : col) {
        REQUIRE(v == "x");
    }
    REQUIRE(drain::Column<std::string>::filled(0, "x").empty());
}
