#include "strata/Dump.hpp"

#include "strata/ast/Builders.hpp"
#include "strata/ir/Builders.hpp"

#include "doctest/doctest.h"

namespace strata {

TEST_CASE("Dump expressions") {
    auto expr = ast::add(ast::mul(ast::ident("x"), ast::literal(2)), ast::call("f", ast::ident("y"),
            ast::mod(ast::ident("z"), ast::literal(-3))));
    CHECK_EQ(dumpExpr(expr.get()), "(x * 2) + f(y, z % -3)");

    auto cond = ast::either(ast::compare(ast::ident("a"), ast::kLte, ast::literal(1)),
            ast::negate(ir::flag("b")));
    CHECK_EQ(dumpBool(cond.get()), "(a <= 1 || !@b)");
}

TEST_CASE("Dump source") {
    auto stmt = ast::def("f", {"p", "q"}, ast::ret(ast::ident("p"), ast::ident("q")),
            ast::var("x", ast::literal(0), ast::seq(ast::multiAssign({"x", "y"}, ast::call("f", ast::literal(1),
            ast::literal(2))), ast::loop(ast::compare(ast::ident("x"), ast::kGt, ast::literal(0)),
            ast::ifElse(ast::compare(ast::ident("x"), ast::kNeq, ast::ident("y")), ast::nop(), ast::ret())))));
    CHECK_EQ(dumpSource(stmt.get()),
            "def f(p, q) {\n"
            "  return p, q\n"
            "}\n"
            "var x = 0\n"
            "x, y := f(1, 2)\n"
            "while x > 0 {\n"
            "  if x != y {\n"
            "    nop\n"
            "  } else {\n"
            "    return\n"
            "  }\n"
            "}\n");
}

TEST_CASE("Dump IR") {
    auto assign = ir::assign("a", ast::add(ast::ident("b"), ast::literal(1)));
    assign->setLiveness({"a", "c"});
    auto compare = ir::compare("a", "c");
    compare->setLiveness({});
    auto block = ir::seq(std::move(assign), std::move(compare), ir::loop(ir::flag("c"), ir::seq()));

    SUBCASE("with liveness") {
        CHECK_EQ(dumpIR(block.get()),
                "a := b + 1  # {a, c}\n"
                "cmp a, c  # {}\n"
                "while @c {\n"
                "}\n");
    }
    SUBCASE("without liveness") {
        CHECK_EQ(dumpIR(block.get(), false),
                "a := b + 1\n"
                "cmp a, c\n"
                "while @c {\n"
                "}\n");
    }
}

} // namespace strata
