#include "strata/Inliner.hpp"

#include "strata/ast/Builders.hpp"
#include "strata/Dump.hpp"
#include "strata/ErrorReporter.hpp"
#include "strata/Flattener.hpp"
#include "strata/NameGenerator.hpp"
#include "strata/Normalizer.hpp"
#include "strata/Validator.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <list>

namespace strata {

class InlinerTestFixture {
public:
    InlinerTestFixture(): m_errorReporter(std::make_shared<ErrorReporter>(true)) {}
    virtual ~InlinerTestFixture() = default;

protected:
    // Precompiles, lowers and flattens |program|, returning the IR dump without liveness, or an empty string if
    // lowering failed.
    std::string lower(std::unique_ptr<ast::StmtAST> program,
            int64_t maxMultiplyUnroll = Inliner::kDefaultMaxMultiplyUnroll) {
        auto precompiled = Normalizer::precompile(std::move(program));
        NameGenerator names;
        Inliner inliner(m_errorReporter, &names);
        inliner.setMaxMultiplyUnroll(maxMultiplyUnroll);
        auto lowered = inliner.inlineProgram(precompiled.get(), m_builtins);
        if (!lowered) { return std::string(); }
        CHECK(Validator::validateInlined(lowered.get()));
        Flattener flattener;
        auto flat = flattener.flatten(std::move(lowered));
        return dumpIR(flat.get(), false);
    }

    void defineBuiltin(const std::string& name, std::vector<std::string> parameters,
            std::unique_ptr<ast::StmtAST> body) {
        m_bodies.emplace_back(Normalizer::precompile(std::move(body)));
        m_builtins = m_builtins.extend(name, Function(std::move(parameters), m_bodies.back().get(), m_builtins));
    }

    void checkSingleError(ErrorReporter::ErrorKind kind, const std::string& subject) {
        REQUIRE_EQ(m_errorReporter->errorCount(), 1);
        CHECK_EQ(m_errorReporter->errors()[0].kind, kind);
        CHECK_EQ(m_errorReporter->errors()[0].subject, subject);
    }

    std::shared_ptr<ErrorReporter> m_errorReporter;
    FunctionTable m_builtins;
    std::list<std::unique_ptr<ast::StmtAST>> m_bodies;
};

TEST_CASE_FIXTURE(InlinerTestFixture, "Inliner bindings and assignment") {
    SUBCASE("unshadowed bindings keep their names") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::add(ast::ident("a"), ast::literal(2)),
                ast::assign("a", ast::ident("b")))));
        CHECK_EQ(dump, "a := 1\nb := a + 2\na := b\n");
        CHECK(m_errorReporter->ok());
    }
    SUBCASE("shadowing binding is renamed") {
        auto dump = lower(ast::var("x", ast::literal(1), ast::var("x", ast::add(ast::ident("x"), ast::literal(1)),
                ast::assign("x", ast::literal(5)))));
        CHECK_EQ(dump, "x := 1\n_1 := x + 1\n_1 := 5\n");
    }
    SUBCASE("undefined variable in an expression") {
        auto dump = lower(ast::var("r", ast::literal(0), ast::assign("r", ast::ident("q"))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedVariable, "q");
    }
    SUBCASE("assignment to an unbound name") {
        auto dump = lower(ast::assign("z", ast::literal(1)));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedVariable, "z");
    }
    SUBCASE("several names without a call") {
        auto dump = lower(ast::var("r", ast::literal(0), ast::var("s", ast::literal(0),
                ast::multiAssign({"r", "s"}, ast::literal(1)))));
        CHECK(dump.empty());
        REQUIRE_EQ(m_errorReporter->errorCount(), 1);
        CHECK_EQ(m_errorReporter->errors()[0].kind, ErrorReporter::kArityMismatch);
    }
    SUBCASE("binding made in one branch is unknown in the other") {
        auto dump = lower(ast::var("r", ast::literal(0), ast::ifElse(ast::compare(ast::ident("r"), ast::kLt,
                ast::literal(1)), ast::var("t", ast::literal(1), ast::assign("r", ast::ident("t"))),
                ast::assign("r", ast::ident("t")))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedVariable, "t");
    }
    SUBCASE("top level return is lowered and dropped") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::ret(ast::ident("a"))));
        CHECK_EQ(dump, "a := 1\n");
    }
    SUBCASE("top level return still reports errors") {
        auto dump = lower(ast::ret(ast::ident("q")));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedVariable, "q");
    }
}

TEST_CASE_FIXTURE(InlinerTestFixture, "Inliner calls") {
    SUBCASE("multiply by three returned through a call") {
        auto dump = lower(ast::def("f", {}, ast::var("x", ast::literal(0), ast::var("y", ast::literal(0),
                ast::seq(ast::assign("x", ast::literal(5)), ast::assign("y", ast::mul(ast::ident("x"),
                ast::literal(3))), ast::ret(ast::ident("y"))))),
                ast::var("r", ast::literal(0), ast::assign("r", ast::call("f")))));
        CHECK_EQ(dump, "r := 0\nr := 0\nx := 0\ny := 0\nx := 5\ny := x + (x + x)\nr := y\n");
        CHECK(m_errorReporter->ok());
    }
    SUBCASE("sequential calls with overlapping names are isolated") {
        auto dump = lower(ast::def("f", {"x"}, ast::var("y", ast::add(ast::ident("x"), ast::literal(1)),
                ast::ret(ast::ident("y"))), ast::var("x", ast::literal(10), ast::var("y", ast::literal(0),
                ast::seq(ast::assign("y", ast::call("f", ast::ident("x"))),
                    ast::assign("y", ast::call("f", ast::ident("y"))))))));
        CHECK_EQ(dump,
                "x := 10\n"
                "y := 0\n"
                "_1 := x\n"
                "y := 0\n"
                "_2 := _1 + 1\n"
                "y := _2\n"
                "_3 := y\n"
                "y := 0\n"
                "_4 := _3 + 1\n"
                "y := _4\n");
    }
    SUBCASE("multiple return values") {
        auto dump = lower(ast::def("f", {"a", "b"}, ast::ret(ast::ident("b"), ast::ident("a")),
                ast::var("r", ast::literal(0), ast::var("s", ast::literal(0),
                ast::multiAssign({"r", "s"}, ast::call("f", ast::literal(1), ast::literal(2)))))));
        CHECK_EQ(dump, "r := 0\ns := 0\n_1 := 1\n_2 := 2\nr := 0\ns := 0\nr := _2\ns := _1\n");
    }
    SUBCASE("unassigned return values are dropped") {
        auto dump = lower(ast::def("f", {}, ast::ret(ast::literal(1), ast::literal(2)),
                ast::var("r", ast::literal(0), ast::assign("r", ast::call("f")))));
        CHECK_EQ(dump, "r := 0\nr := 0\nr := 1\n");
    }
    SUBCASE("inner call site gets its own return slots") {
        auto dump = lower(ast::def("g", {}, ast::ret(ast::literal(7)),
                ast::def("f", {}, ast::var("t", ast::literal(0), ast::seq(ast::assign("t", ast::call("g")),
                    ast::ret(ast::ident("t")))),
                ast::var("r", ast::literal(0), ast::assign("r", ast::call("f"))))));
        CHECK_EQ(dump, "r := 0\nr := 0\nt := 0\nt := 0\nt := 7\nr := t\n");
    }
    SUBCASE("calls nested in expressions are hoisted") {
        auto dump = lower(ast::def("f", {"a"}, ast::ret(ast::add(ast::ident("a"), ast::ident("a"))),
                ast::var("r", ast::literal(0), ast::assign("r", ast::add(ast::call("f", ast::literal(1)),
                ast::call("f", ast::literal(2)))))));
        CHECK_EQ(dump,
                "r := 0\n"
                "_2 := 1\n"
                "_1 := 0\n"
                "_1 := _2 + _2\n"
                "_4 := 2\n"
                "_3 := 0\n"
                "_3 := _4 + _4\n"
                "r := _1 + _3\n");
    }
    SUBCASE("later definition shadows an earlier one") {
        auto dump = lower(ast::def("f", {}, ast::ret(ast::literal(1)), ast::def("f", {}, ast::ret(ast::literal(2)),
                ast::var("r", ast::literal(0), ast::assign("r", ast::call("f"))))));
        CHECK_EQ(dump, "r := 0\nr := 0\nr := 2\n");
        CHECK(m_errorReporter->ok());
    }
    SUBCASE("undefined function") {
        auto dump = lower(ast::var("r", ast::literal(0), ast::assign("r", ast::call("g"))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedFunction, "g");
    }
    SUBCASE("functions can't call themselves") {
        auto dump = lower(ast::def("f", {}, ast::var("t", ast::literal(0), ast::seq(ast::assign("t", ast::call("f")),
                ast::ret(ast::ident("t")))), ast::var("r", ast::literal(0), ast::assign("r", ast::call("f")))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedFunction, "f");
    }
    SUBCASE("wrong number of arguments") {
        auto dump = lower(ast::def("f", {"a"}, ast::ret(ast::ident("a")),
                ast::var("r", ast::literal(0), ast::assign("r", ast::call("f")))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kArityMismatch, "f");
    }
    SUBCASE("more names than returned values") {
        auto dump = lower(ast::def("f", {"a"}, ast::ret(ast::ident("a")),
                ast::var("r", ast::literal(0), ast::var("s", ast::literal(0),
                ast::multiAssign({"r", "s"}, ast::call("f", ast::literal(1)))))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kArityMismatch, "f");
    }
}

TEST_CASE_FIXTURE(InlinerTestFixture, "Inliner arithmetic") {
    SUBCASE("literal times compound expression") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::literal(3), ast::add(ast::ident("a"), ast::ident("a")))))));
        CHECK_EQ(dump, "a := 1\nb := 0\nb := (a + a) + ((a + a) + (a + a))\n");
    }
    SUBCASE("call operand is inlined once per term") {
        auto dump = lower(ast::def("g", {}, ast::ret(ast::literal(7)), ast::var("b", ast::literal(0),
                ast::assign("b", ast::mul(ast::literal(2), ast::call("g"))))));
        CHECK_EQ(dump, "b := 0\n_1 := 0\n_1 := 7\n_2 := 0\n_2 := 7\nb := _1 + _2\n");
    }
    SUBCASE("literal times literal") {
        auto dump = lower(ast::var("b", ast::literal(0), ast::assign("b", ast::mul(ast::literal(2),
                ast::literal(3)))));
        CHECK_EQ(dump, "b := 0\nb := 3 + 3\n");
    }
    SUBCASE("multiply by zero") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::literal(0), ast::ident("a"))))));
        CHECK_EQ(dump, "a := 1\nb := 0\nb := 0\n");
    }
    SUBCASE("multiply by zero still resolves the operand") {
        auto dump = lower(ast::var("b", ast::literal(0), ast::assign("b", ast::mul(ast::ident("c"),
                ast::literal(0)))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedVariable, "c");
    }
    SUBCASE("multiply by one") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::ident("a"), ast::literal(1))))));
        CHECK_EQ(dump, "a := 1\nb := 0\nb := a\n");
    }
    SUBCASE("negative factor calls the builtin") {
        defineBuiltin("*", {"x", "y"}, ast::ret(ast::add(ast::ident("x"), ast::ident("y"))));
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::ident("a"), ast::literal(-2))))));
        CHECK_EQ(dump, "a := 1\nb := 0\n_2 := a\n_3 := -2\n_1 := 0\n_1 := _2 + _3\nb := _1\n");
    }
    SUBCASE("factor above the unroll limit calls the builtin") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::ident("a"), ast::literal(3))))), 2);
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedFunction, "*");
    }
    SUBCASE("product of two variables needs the builtin") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mul(ast::ident("a"), ast::ident("b"))))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedFunction, "*");
    }
    SUBCASE("division needs the builtin") {
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::div(ast::ident("a"), ast::literal(2))))));
        CHECK(dump.empty());
        checkSingleError(ErrorReporter::kUndefinedFunction, "/");
    }
    SUBCASE("modulo calls the builtin") {
        defineBuiltin("%", {"n", "d"}, ast::ret(ast::ident("n")));
        auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(0), ast::assign("b",
                ast::mod(ast::ident("a"), ast::literal(2))))));
        CHECK_EQ(dump, "a := 1\nb := 0\n_2 := a\n_3 := 2\n_1 := 0\n_1 := _2\nb := _1\n");
    }
}

TEST_CASE_FIXTURE(InlinerTestFixture, "Inliner comparisons") {
    SUBCASE("relational operators become flag formulas") {
        struct RelOpCase {
            ast::RelOp relOp;
            const char* guard;
        };
        const RelOpCase cases[] = {
            { ast::kEq, "if (!@_1 && !@_2) {" },
            { ast::kNeq, "if (@_1 || @_2) {" },
            { ast::kLt, "if @_2 {" },
            { ast::kLte, "if !@_1 {" },
            { ast::kGt, "if @_1 {" },
            { ast::kGte, "if !@_2 {" }
        };

        for (const auto& relOpCase : cases) {
            auto dump = lower(ast::var("a", ast::literal(1), ast::var("b", ast::literal(2), ast::ifElse(
                    ast::compare(ast::ident("a"), relOpCase.relOp, ast::ident("b")),
                    ast::assign("a", ast::literal(3)), ast::nop()))));
            CHECK_EQ(dump, fmt::format("a := 1\nb := 2\n_1 := a\n_2 := b\ncmp _1, _2\n{}\n  a := 3\n}} else {{\n}}\n",
                    relOpCase.guard));
        }
    }
    SUBCASE("loop guard is recomputed at the end of the body") {
        auto dump = lower(ast::var("i", ast::literal(0), ast::loop(ast::compare(ast::ident("i"), ast::kLt,
                ast::literal(3)), ast::assign("i", ast::add(ast::ident("i"), ast::literal(1))))));
        CHECK_EQ(dump,
                "i := 0\n"
                "_1 := i\n"
                "_2 := 3\n"
                "cmp _1, _2\n"
                "while @_2 {\n"
                "  i := i + 1\n"
                "  _1 := i\n"
                "  _2 := 3\n"
                "  cmp _1, _2\n"
                "}\n");
    }
    SUBCASE("flags can't appear in source") {
        auto dump = lower(ast::ifElse(std::make_unique<ast::FlagAST>("z"), ast::nop(), ast::nop()));
        CHECK(dump.empty());
        REQUIRE_EQ(m_errorReporter->errorCount(), 1);
        CHECK_EQ(m_errorReporter->errors()[0].kind, ErrorReporter::kInternalError);
    }
}

TEST_CASE("Inliner settings") {
    NameGenerator names;
    Inliner inliner(std::make_shared<ErrorReporter>(true), &names);
    CHECK_EQ(inliner.maxMultiplyUnroll(), Inliner::kDefaultMaxMultiplyUnroll);
    inliner.setMaxMultiplyUnroll(4);
    CHECK_EQ(inliner.maxMultiplyUnroll(), 4);
}

} // namespace strata
