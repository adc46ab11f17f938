#include "strata/Validator.hpp"

#include "strata/ast/Builders.hpp"
#include "strata/ir/Builders.hpp"

#include "doctest/doctest.h"

namespace strata {

TEST_CASE("Validator precompiled source") {
    SUBCASE("left nested sequence") {
        auto stmt = ast::seq(ast::seq(ast::assign("a", ast::literal(1)), ast::assign("b", ast::literal(2))),
                ast::assign("c", ast::literal(3)));
        CHECK(!Validator::validatePrecompiled(stmt.get()));
    }
    SUBCASE("conditional heading a sequence") {
        auto stmt = ast::seq(ast::ifElse(ast::compare(ast::ident("a"), ast::kEq, ast::literal(0)), ast::nop(),
                ast::nop()), ast::assign("c", ast::literal(3)));
        CHECK(!Validator::validatePrecompiled(stmt.get()));
    }
    SUBCASE("statement after return") {
        auto stmt = ast::seq(ast::ret(), ast::assign("c", ast::literal(3)));
        CHECK(!Validator::validatePrecompiled(stmt.get()));
    }
    SUBCASE("violation inside a function body") {
        auto stmt = ast::def("f", {}, ast::seq(ast::nop(), ast::ret()), ast::nop());
        CHECK(!Validator::validatePrecompiled(stmt.get()));
    }
    SUBCASE("binding with the generated name prefix") {
        auto stmt = ast::var("a", ast::literal(1), ast::var("_1", ast::literal(2), ast::assign("a", ast::literal(3))));
        CHECK(Validator::validatePrecompiled(stmt.get()));
        CHECK(!Validator::validatePrecompiled(stmt.get(), "_"));
        CHECK(Validator::validatePrecompiled(stmt.get(), "t"));
    }
    SUBCASE("parameter with the generated name prefix") {
        auto stmt = ast::def("f", {"x", "_x"}, ast::ret(ast::ident("x")), ast::nop());
        CHECK(!Validator::validatePrecompiled(stmt.get(), "_"));
    }
    SUBCASE("valid tree") {
        auto stmt = ast::seq(ast::assign("a", ast::literal(1)), ast::ifElse(ast::compare(ast::ident("a"), ast::kEq,
                ast::literal(0)), ast::ret(ast::ident("a")), ast::seq(ast::assign("b", ast::literal(2)),
                ast::ret(ast::ident("b")))));
        CHECK(Validator::validatePrecompiled(stmt.get()));
    }
}

TEST_CASE("Validator inlined IR") {
    SUBCASE("call left in an expression") {
        auto block = ir::seq(ir::assign("a", ast::call("f")));
        CHECK(!Validator::validateInlined(block.get()));
    }
    SUBCASE("multiplication left in an expression") {
        auto block = ir::assign("a", ast::mul(ast::ident("b"), ast::ident("c")));
        CHECK(!Validator::validateInlined(block.get()));
    }
    SUBCASE("comparison left in a guard") {
        auto block = ir::loop(ast::compare(ast::ident("a"), ast::kLt, ast::literal(1)), ir::seq());
        CHECK(!Validator::validateInlined(block.get()));
    }
    SUBCASE("already tagged") {
        auto block = ir::assign("a", ast::literal(1));
        block->setLiveness({"a"});
        CHECK(!Validator::validateInlined(block.get()));
    }
    SUBCASE("valid tree") {
        auto block = ir::seq(ir::assign("a", ast::add(ast::ident("b"), ast::literal(1))), ir::compare("a", "b"),
                ir::ifElse(ast::both(ir::flag("a"), ast::negate(ir::flag("b"))), ir::seq(), ir::par()));
        CHECK(Validator::validateInlined(block.get()));
    }
}

TEST_CASE("Validator flattened IR") {
    SUBCASE("nested sequence") {
        auto block = ir::seq(ir::assign("a", ast::literal(1)), ir::seq(ir::assign("b", ast::literal(2)),
                ir::assign("c", ast::literal(3))));
        CHECK(!Validator::validateFlattened(block.get()));
    }
    SUBCASE("single instruction sequence in a branch") {
        auto block = ir::ifElse(ir::flag("f"), ir::seq(ir::assign("a", ast::literal(1))), ir::seq());
        CHECK(!Validator::validateFlattened(block.get()));
    }
    SUBCASE("valid tree") {
        auto block = ir::seq(ir::assign("a", ast::literal(1)), ir::loop(ir::flag("f"), ir::assign("a",
                ast::literal(2))));
        CHECK(Validator::validateFlattened(block.get()));
    }
}

TEST_CASE("Validator liveness") {
    SUBCASE("missing tag") {
        auto block = ir::seq(ir::assign("a", ast::literal(1)));
        CHECK(!Validator::validateLiveness(block.get()));
    }
    SUBCASE("assignment to a dead name") {
        auto block = ir::assign("a", ast::literal(1));
        block->setLiveness({"b"});
        CHECK(!Validator::validateLiveness(block.get()));
    }
    SUBCASE("loop tag missing a guard flag") {
        auto block = ir::loop(ir::flag("f"), ir::seq());
        block->setLiveness({"g"});
        CHECK(!Validator::validateLiveness(block.get()));
    }
    SUBCASE("valid tree") {
        auto assign = ir::assign("a", ast::literal(1));
        assign->setLiveness({"a"});
        auto block = ir::seq(std::move(assign));
        CHECK(Validator::validateLiveness(block.get()));
    }
}

} // namespace strata
