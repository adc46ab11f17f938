#include "strata/NameGenerator.hpp"

#include "doctest/doctest.h"

namespace strata {

TEST_CASE("NameGenerator") {
    SUBCASE("default prefix") {
        NameGenerator names;
        CHECK_EQ(names.count(), 0);
        CHECK_EQ(names.next(), "_1");
        CHECK_EQ(names.next(), "_2");
        CHECK_EQ(names.next(), "_3");
        CHECK_EQ(names.count(), 3);
    }
    SUBCASE("custom prefix") {
        NameGenerator names("t");
        CHECK_EQ(names.prefix(), "t");
        CHECK_EQ(names.next(), "t1");
        CHECK_EQ(names.next(), "t2");
    }
    SUBCASE("generators are independent") {
        NameGenerator a;
        NameGenerator b;
        CHECK_EQ(a.next(), "_1");
        CHECK_EQ(a.next(), "_2");
        CHECK_EQ(b.next(), "_1");
    }
}

} // namespace strata
