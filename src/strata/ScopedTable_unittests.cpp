#include "strata/ScopedTable.hpp"

#include "doctest/doctest.h"

#include <string>

namespace strata {

TEST_CASE("ScopedTable") {
    SUBCASE("empty table") {
        ScopedTable<std::string> table;
        CHECK(table.empty());
        CHECK(table.find("x") == nullptr);
        CHECK(!table.contains("x"));
    }
    SUBCASE("extend leaves the original unchanged") {
        ScopedTable<std::string> outer;
        auto inner = outer.extend("x", "_1");
        CHECK(outer.empty());
        REQUIRE(inner.find("x") != nullptr);
        CHECK_EQ(*inner.find("x"), "_1");
    }
    SUBCASE("newer bindings shadow older ones") {
        auto table = ScopedTable<int>().extend("x", 1).extend("y", 2).extend("x", 3);
        REQUIRE(table.find("x") != nullptr);
        CHECK_EQ(*table.find("x"), 3);
        REQUIRE(table.find("y") != nullptr);
        CHECK_EQ(*table.find("y"), 2);
    }
    SUBCASE("sibling branches don't observe each other") {
        auto root = ScopedTable<int>().extend("a", 1);
        auto left = root.extend("b", 2);
        auto right = root.extend("c", 3);
        CHECK(left.contains("a"));
        CHECK(left.contains("b"));
        CHECK(!left.contains("c"));
        CHECK(right.contains("a"));
        CHECK(right.contains("c"));
        CHECK(!right.contains("b"));
        CHECK(!root.contains("b"));
        CHECK(!root.contains("c"));
    }
}

} // namespace strata
