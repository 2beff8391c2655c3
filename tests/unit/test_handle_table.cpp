#include <catch2/catch_test_macros.hpp>
#include "warden/handles/handle_table.hpp"
#include <memory>
#include <string>
using namespace warden;
using namespace warden::handles;
TEST_CASE("HandleTable - Create and lookup", "[handles]") {
    HandleTable<std::string> table;
    SECTION("Handles start at one and increase") {
        const Handle first = table.Create("a");
        const Handle second = table.Create("b");
        REQUIRE(first == HandleConstants::FIRST_HANDLE);
        REQUIRE(second > first);
        REQUIRE(table.Count() == 2);
    }
    SECTION("With reads under the lock") {
        const Handle handle = table.Create("wallet");
        auto length = table.With(handle, [](const std::string& item) { return item.size(); });
        REQUIRE(length.has_value());
        REQUIRE(*length == 6);
    }
    SECTION("WithMut mutates in place") {
        const Handle handle = table.Create("x");
        REQUIRE(table.WithMut(handle, [](std::string& item) {
            item += "y";
            return true;
        }).has_value());
        REQUIRE(table.Get(handle) == std::optional<std::string>("xy"));
    }
    SECTION("Unknown handles are absent, not undefined") {
        REQUIRE_FALSE(table.Get(42).has_value());
        REQUIRE_FALSE(table.With(42, [](const std::string&) { return 0; }).has_value());
        REQUIRE_FALSE(table.Contains(HandleConstants::INVALID_HANDLE));
        REQUIRE_FALSE(table.Destroy(42).has_value());
    }
}
TEST_CASE("HandleTable - Destroy", "[handles]") {
    HandleTable<std::unique_ptr<int>> table;
    const Handle handle = table.Create(std::make_unique<int>(7));
    SECTION("Destroy hands the item back once") {
        auto item = table.Destroy(handle);
        REQUIRE(item.has_value());
        REQUIRE(**item == 7);
        REQUIRE_FALSE(table.Destroy(handle).has_value());
        REQUIRE_FALSE(table.Contains(handle));
    }
    SECTION("Destroyed handles are never reissued") {
        REQUIRE(table.Destroy(handle).has_value());
        const Handle next = table.Create(std::make_unique<int>(8));
        REQUIRE(next != handle);
        REQUIRE(next > handle);
    }
    SECTION("Drain empties the table") {
        table.Create(std::make_unique<int>(9));
        auto drained = table.Drain();
        REQUIRE(drained.size() == 2);
        REQUIRE(table.Count() == 0);
        REQUIRE(table.Handles().empty());
    }
}
