#include "strata/Normalizer.hpp"

#include "strata/ast/Builders.hpp"
#include "strata/Dump.hpp"
#include "strata/Validator.hpp"

#include "doctest/doctest.h"

namespace {

std::unique_ptr<strata::ast::BoolAST> aLessThanB() {
    return strata::ast::compare(strata::ast::ident("a"), strata::ast::kLt, strata::ast::ident("b"));
}

} // namespace

namespace strata {

TEST_CASE("Normalizer leftify") {
    SUBCASE("rotates nested sequences") {
        auto stmt = ast::seq(ast::seq(ast::assign("x", ast::literal(1)), ast::assign("y", ast::literal(2))),
                ast::assign("z", ast::literal(3)));
        auto expected = ast::seq(ast::assign("x", ast::literal(1)), ast::assign("y", ast::literal(2)),
                ast::assign("z", ast::literal(3)));
        auto result = Normalizer::leftify(std::move(stmt));
        CHECK(ast::equal(result.get(), expected.get()));
    }
    SUBCASE("deeply left nested") {
        auto stmt = ast::seq(ast::seq(ast::seq(ast::assign("a", ast::literal(1)), ast::assign("b", ast::literal(2))),
                ast::assign("c", ast::literal(3))), ast::assign("d", ast::literal(4)));
        auto expected = ast::seq(ast::assign("a", ast::literal(1)), ast::assign("b", ast::literal(2)),
                ast::assign("c", ast::literal(3)), ast::assign("d", ast::literal(4)));
        auto result = Normalizer::leftify(std::move(stmt));
        CHECK(ast::equal(result.get(), expected.get()));
    }
    SUBCASE("inside loop bodies") {
        auto stmt = ast::loop(aLessThanB(), ast::seq(ast::seq(ast::assign("a", ast::literal(1)),
                ast::assign("b", ast::literal(2))), ast::assign("c", ast::literal(3))));
        auto expected = ast::loop(aLessThanB(), ast::seq(ast::assign("a", ast::literal(1)),
                ast::assign("b", ast::literal(2)), ast::assign("c", ast::literal(3))));
        auto result = Normalizer::leftify(std::move(stmt));
        CHECK(ast::equal(result.get(), expected.get()));
    }
}

TEST_CASE("Normalizer absorbBranches") {
    SUBCASE("tail is copied into both branches") {
        auto stmt = ast::seq(ast::ifElse(aLessThanB(), ast::ret(ast::literal(1)), ast::nop()),
                ast::assign("x", ast::literal(2)));
        auto expected = ast::ifElse(aLessThanB(), ast::seq(ast::ret(ast::literal(1)),
                ast::assign("x", ast::literal(2))), ast::assign("x", ast::literal(2)));
        auto result = Normalizer::absorbBranches(std::move(stmt));
        CHECK(ast::equal(result.get(), expected.get()));
    }
    SUBCASE("nop collapses") {
        auto stmt = ast::seq(ast::nop(), ast::assign("x", ast::literal(1)));
        auto result = Normalizer::absorbBranches(std::move(stmt));
        auto expected = ast::assign("x", ast::literal(1));
        CHECK(ast::equal(result.get(), expected.get()));
    }
    SUBCASE("tail that collapses to nop") {
        auto stmt = ast::seq(ast::assign("x", ast::literal(1)), ast::seq(ast::nop(), ast::nop()));
        auto result = Normalizer::absorbBranches(std::move(stmt));
        auto expected = ast::assign("x", ast::literal(1));
        CHECK(ast::equal(result.get(), expected.get()));
    }
}

TEST_CASE("Normalizer returns") {
    auto assign = ast::assign("x", ast::literal(1));
    CHECK(!Normalizer::returns(assign.get()));
    auto noop = ast::nop();
    CHECK(!Normalizer::returns(noop.get()));
    auto loop = ast::loop(aLessThanB(), ast::ret());
    CHECK(Normalizer::returns(loop.get()));
    auto conditional = ast::ifElse(aLessThanB(), ast::nop(), ast::ret(ast::literal(0)));
    CHECK(Normalizer::returns(conditional.get()));
    auto binding = ast::var("y", ast::literal(0), ast::seq(ast::assign("y", ast::literal(1)), ast::ret()));
    CHECK(Normalizer::returns(binding.get()));
    auto def = ast::def("f", {}, ast::ret(ast::literal(1)), ast::nop());
    CHECK(Normalizer::returns(def.get()));
}

TEST_CASE("Normalizer precompile") {
    SUBCASE("code after a return is dropped") {
        auto withTail = ast::seq(ast::seq(ast::assign("y", ast::literal(1)), ast::ret(ast::ident("y"))),
                ast::assign("z", ast::literal(2)));
        auto alone = ast::seq(ast::assign("y", ast::literal(1)), ast::ret(ast::ident("y")));
        auto a = Normalizer::precompile(std::move(withTail));
        auto b = Normalizer::precompile(std::move(alone));
        CHECK(ast::equal(a.get(), b.get()));
    }
    SUBCASE("loop that returns swallows its tail") {
        auto withTail = ast::seq(ast::loop(aLessThanB(), ast::ret(ast::ident("a"))), ast::assign("b",
                ast::literal(0)));
        auto alone = ast::loop(aLessThanB(), ast::ret(ast::ident("a")));
        auto a = Normalizer::precompile(std::move(withTail));
        CHECK(ast::equal(a.get(), alone.get()));
    }
    SUBCASE("tail moves into the branch that doesn't return") {
        auto stmt = ast::seq(ast::ifElse(aLessThanB(), ast::ret(ast::literal(1)), ast::nop()),
                ast::assign("x", ast::literal(2)));
        auto expected = ast::ifElse(aLessThanB(), ast::ret(ast::literal(1)), ast::assign("x", ast::literal(2)));
        auto result = Normalizer::precompile(std::move(stmt));
        CHECK(ast::equal(result.get(), expected.get()));
        CHECK(Validator::validatePrecompiled(result.get()));
    }
    SUBCASE("idempotent") {
        auto stmt = ast::def("f", {"p"}, ast::seq(ast::seq(ast::ifElse(aLessThanB(), ast::assign("a",
                ast::literal(1)), ast::nop()), ast::assign("b", ast::literal(2))), ast::ret(ast::ident("b")),
                ast::assign("c", ast::literal(3))),
                ast::seq(ast::seq(ast::nop(), ast::ifElse(aLessThanB(), ast::nop(), ast::ret())),
                    ast::loop(aLessThanB(), ast::seq(ast::assign("a", ast::add(ast::ident("a"), ast::literal(1))),
                        ast::nop()))));
        auto once = Normalizer::precompile(std::move(stmt));
        CHECK(Validator::validatePrecompiled(once.get()));
        auto twice = Normalizer::precompile(ast::clone(once.get()));
        CHECK_MESSAGE(ast::equal(once.get(), twice.get()), dumpSource(once.get()) + "\n" + dumpSource(twice.get()));
    }
}

} // namespace strata
