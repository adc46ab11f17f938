#include "strata/ast/AST.hpp"

#include "strata/ast/Builders.hpp"

#include "doctest/doctest.h"

namespace strata {
namespace ast {

TEST_CASE("AST clone and equal") {
    SUBCASE("clone is a deep copy") {
        auto original = seq(def("f", {"a"}, ret(add(ident("a"), literal(1))), nop()),
                var("x", call("f", literal(2)), loop(compare(ident("x"), kLt, literal(10)),
                        assign("x", mul(ident("x"), literal(2))))));
        auto copy = clone(original.get());
        CHECK(copy.get() != original.get());
        CHECK(equal(original.get(), copy.get()));

        // Mutating the copy must leave the original alone.
        auto sequence = static_cast<SequenceAST*>(copy.get());
        static_cast<FunctionDefAST*>(sequence->first.get())->name = "g";
        CHECK(!equal(original.get(), copy.get()));
    }
    SUBCASE("expressions differ by operator") {
        auto a = add(ident("x"), literal(1));
        auto b = mul(ident("x"), literal(1));
        CHECK(!equal(a.get(), b.get()));
        CHECK(equal(a.get(), clone(a.get()).get()));
    }
    SUBCASE("call arguments compare in order") {
        auto a = call("f", ident("x"), ident("y"));
        auto b = call("f", ident("y"), ident("x"));
        auto c = call("f", ident("x"));
        CHECK(!equal(a.get(), b.get()));
        CHECK(!equal(a.get(), c.get()));
    }
    SUBCASE("boolean expressions") {
        auto a = both(compare(ident("x"), kEq, literal(0)), negate(compare(ident("y"), kGte, literal(1))));
        auto b = both(compare(ident("x"), kEq, literal(0)), negate(compare(ident("y"), kGt, literal(1))));
        CHECK(equal(a.get(), clone(a.get()).get()));
        CHECK(!equal(a.get(), b.get()));
    }
}

TEST_CASE("AST returnArity") {
    SUBCASE("no return") {
        auto body = assign("x", literal(1));
        CHECK_EQ(returnArity(body.get()), 0);
    }
    SUBCASE("longest return wins") {
        auto body = ifElse(compare(ident("x"), kLt, literal(0)), ret(ident("x")),
                seq(assign("x", literal(1)), ret(ident("x"), literal(2), literal(3))));
        CHECK_EQ(returnArity(body.get()), 3);
    }
    SUBCASE("returns inside loops and bindings count") {
        auto body = var("y", literal(0), loop(compare(ident("y"), kLt, literal(3)), ret(ident("y"), ident("y"))));
        CHECK_EQ(returnArity(body.get()), 2);
    }
    SUBCASE("nested function bodies don't count") {
        auto body = def("g", {}, ret(literal(1), literal(2), literal(3), literal(4)), ret(literal(5)));
        CHECK_EQ(returnArity(body.get()), 1);
    }
}

TEST_CASE("AST topLevelBindings") {
    auto program = def("f", {}, var("hidden", literal(0), ret(ident("hidden"))),
            seq(var("a", literal(1), var("b", literal(2), nop())),
                ifElse(compare(ident("a"), kLt, ident("b")), var("c", literal(3), nop()), nop())));
    auto names = topLevelBindings(program.get());
    CHECK_EQ(names.size(), 2);
    CHECK_EQ(names.count("a"), 1);
    CHECK_EQ(names.count("b"), 1);
    CHECK_EQ(names.count("c"), 0);
    CHECK_EQ(names.count("hidden"), 0);
}

} // namespace ast
} // namespace strata
