#include <drain/runtime/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

using namespace drain;

TEST_CASE("parse_csv_simple: infers column types", "[runtime][csv]") {
    auto table = runtime::parse_csv_simple(
        "city,n,price,date\r\n"
        "boston,1,2.5,2020-01-01\r\n"
        "austin,2,3,2020-02-01\r\n");
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 2);

    REQUIRE(std::holds_alternative<Column<std::string>>(*table->find("city")));
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*table->find("n")));
    REQUIRE(std::holds_alternative<Column<double>>(*table->find("price")));
    const auto* dates = std::get_if<Column<Date>>(table->find("date"));
    REQUIRE(dates != nullptr);
    REQUIRE(format_date((*dates)[1]) == "2020-02-01");
}

TEST_CASE("parse_csv_simple: empty fields are null", "[runtime][csv]") {
    auto table = runtime::parse_csv_simple("a,b\n1,\n,x\n3,y\n");
    REQUIRE(table.has_value());

    const auto* a = table->find_entry("a");
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*a->column));
    REQUIRE(a->validity.has_value());
    REQUIRE(*a->validity == std::vector<bool>{true, false, true});

    const auto* b = table->find_entry("b");
    REQUIRE(std::holds_alternative<Column<std::string>>(*b->column));
    REQUIRE(runtime::is_null(*b, 0));
    REQUIRE_FALSE(runtime::is_null(*b, 1));
}

TEST_CASE("parse_csv_simple: malformed input", "[runtime][csv]") {
    SECTION("empty") {
        REQUIRE_FALSE(runtime::parse_csv_simple("").has_value());
    }
    SECTION("field count mismatch") {
        auto table = runtime::parse_csv_simple("a,b\n1,2\n3\n");
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error() == "csv line 3 has 1 fields, expected 2");
    }
}

TEST_CASE("read_csv_simple: reads a file", "[runtime][csv]") {
    auto path = std::filesystem::temp_directory_path() / "drain_test_read_csv_simple.csv";
    {
        std::ofstream out{path};
        out << "city,value\nboston,1\nboston,2\n";
    }
    auto table = runtime::read_csv_simple(path.string());
    std::filesystem::remove(path);
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 2);
    REQUIRE(table->column_names() == std::vector<std::string>{"city", "value"});

    REQUIRE_FALSE(runtime::read_csv_simple("/nonexistent/drain.csv").has_value());
}
