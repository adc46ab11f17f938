#define STRATA_PIPELINE_VALIDATE 1
#include "strata/Pipeline.hpp"

#include "strata/ast/Builders.hpp"
#include "strata/Dump.hpp"
#include "strata/ErrorReporter.hpp"
#include "strata/NameGenerator.hpp"

#include "doctest/doctest.h"

namespace strata {

class CountingPipeline : public Pipeline {
public:
    CountingPipeline(): Pipeline(std::make_shared<ErrorReporter>(true)) {}
    virtual ~CountingPipeline() = default;

    bool afterNormalizer(const ast::StmtAST*) override {
        ++normalized;
        return true;
    }
    bool afterInliner(const ir::IR*) override {
        ++inlined;
        return true;
    }
    bool afterFlattener(const ir::IR*) override {
        ++flattened;
        return !stopAfterFlattener;
    }
    bool afterLivenessAnalyzer(const ir::IR*) override {
        ++analyzed;
        return true;
    }

    int normalized = 0;
    int inlined = 0;
    int flattened = 0;
    int analyzed = 0;
    bool stopAfterFlattener = false;
};

// As with the other Pipeline tests these run every stage together, with the Pipeline validating the output of each
// stage before moving on to the next one.
TEST_CASE("Pipeline defaults") {
    Pipeline p;
    CHECK_EQ(p.maxMultiplyUnroll(), 64);
    CHECK(p.liveOut().empty());
    CHECK(p.builtins().empty());
    CHECK(p.errorReporter()->ok());
}

TEST_CASE("Pipeline multiply by a literal") {
    CountingPipeline p;
    p.setLiveOut({"r"});
    auto tagged = p.compile(ast::def("f", {}, ast::var("x", ast::literal(0), ast::var("y", ast::literal(0),
            ast::seq(ast::assign("x", ast::literal(5)), ast::assign("y", ast::mul(ast::ident("x"), ast::literal(3))),
            ast::ret(ast::ident("y"))))), ast::var("r", ast::literal(0), ast::assign("r", ast::call("f")))));
    REQUIRE(tagged);
    CHECK_EQ(dumpIR(tagged.get()),
            "x := 5  # {x}\n"
            "y := x + (x + x)  # {y}\n"
            "r := y  # {r}\n");
    CHECK(p.errorReporter()->ok());
    CHECK_EQ(p.normalized, 1);
    CHECK_EQ(p.inlined, 1);
    CHECK_EQ(p.flattened, 1);
    CHECK_EQ(p.analyzed, 1);
}

TEST_CASE("Pipeline code after a conditional return") {
    CountingPipeline p;
    p.setLiveOut({"x"});
    auto tagged = p.compile(ast::var("a", ast::literal(1), ast::var("b", ast::literal(2), ast::var("x",
            ast::literal(0), ast::seq(ast::ifElse(ast::compare(ast::ident("a"), ast::kLt, ast::ident("b")),
            ast::ret(ast::literal(1)), ast::nop()), ast::assign("x", ast::literal(2)))))));
    REQUIRE(tagged);
    CHECK_EQ(dumpIR(tagged.get()),
            "b := 2  # {b}\n"
            "x := 0  # {b, x}\n"
            "_2 := b  # {_2, x}\n"
            "cmp _1, _2  # {_2, x}\n"
            "if @_2 {  # {x}\n"
            "} else {\n"
            "  x := 2  # {x}\n"
            "}\n");
}

TEST_CASE("Pipeline undefined function") {
    CountingPipeline p;
    auto tagged = p.compile(ast::var("r", ast::literal(0), ast::assign("r", ast::call("g"))));
    CHECK(!tagged);
    REQUIRE_EQ(p.errorReporter()->errorCount(), 1);
    CHECK_EQ(p.errorReporter()->errors()[0].kind, ErrorReporter::kUndefinedFunction);
    CHECK_EQ(p.errorReporter()->errors()[0].subject, "g");
    CHECK_EQ(p.normalized, 1);
    CHECK_EQ(p.inlined, 0);
    CHECK_EQ(p.analyzed, 0);
}

TEST_CASE("Pipeline source names can't use the generated name prefix") {
    CountingPipeline p;
    auto tagged = p.compile(ast::var("_1", ast::literal(1), ast::assign("_1", ast::literal(2))));
    CHECK(!tagged);
    REQUIRE_EQ(p.errorReporter()->errorCount(), 1);
    CHECK_EQ(p.errorReporter()->errors()[0].kind, ErrorReporter::kInternalError);
    CHECK_EQ(p.inlined, 0);

    CountingPipeline other;
    NameGenerator names("t");
    CHECK(other.compile(ast::var("_1", ast::literal(1), ast::assign("_1", ast::literal(2))), &names));
    CHECK(other.errorReporter()->ok());
}

TEST_CASE("Pipeline hook can stop compilation") {
    CountingPipeline p;
    p.stopAfterFlattener = true;
    auto tagged = p.compile(ast::var("a", ast::literal(1), ast::nop()));
    CHECK(!tagged);
    CHECK_EQ(p.flattened, 1);
    CHECK_EQ(p.analyzed, 0);
}

TEST_CASE("Pipeline builtins") {
    CountingPipeline p;
    p.defineBuiltin("*", {"x", "y"}, ast::ret(ast::add(ast::ident("x"), ast::ident("y"))));
    CHECK(p.builtins().contains("*"));

    SUBCASE("product of two variables") {
        p.setLiveOut({"r"});
        auto tagged = p.compile(ast::var("a", ast::literal(2), ast::var("b", ast::literal(3), ast::var("r",
                ast::literal(0), ast::assign("r", ast::mul(ast::ident("a"), ast::ident("b")))))));
        REQUIRE(tagged);
        CHECK_EQ(dumpIR(tagged.get()),
                "a := 2  # {a}\n"
                "b := 3  # {a, b}\n"
                "_2 := a  # {_2, b}\n"
                "_3 := b  # {_2, _3}\n"
                "_1 := _2 + _3  # {_1}\n"
                "r := _1  # {r}\n");
    }
    SUBCASE("builtins can call earlier builtins") {
        p.defineBuiltin("square", {"v"}, ast::ret(ast::mul(ast::ident("v"), ast::ident("v"))));
        p.setLiveOut({"r"});
        auto tagged = p.compile(ast::var("r", ast::literal(0), ast::assign("r", ast::call("square",
                ast::literal(4)))));
        REQUIRE(tagged);
        CHECK(p.errorReporter()->ok());
    }
    SUBCASE("builtins can't call later builtins") {
        p.defineBuiltin("first", {"v"}, ast::ret(ast::call("second", ast::ident("v"))));
        p.defineBuiltin("second", {"v"}, ast::ret(ast::ident("v")));
        auto tagged = p.compile(ast::var("r", ast::literal(0), ast::assign("r", ast::call("first",
                ast::literal(4)))));
        CHECK(!tagged);
        REQUIRE_EQ(p.errorReporter()->errorCount(), 1);
        CHECK_EQ(p.errorReporter()->errors()[0].subject, "second");
    }
}

TEST_CASE("Pipeline top level bindings stay live") {
    Pipeline p(std::make_shared<ErrorReporter>(true));
    auto program = ast::var("a", ast::literal(1), ast::var("b", ast::add(ast::ident("a"), ast::literal(1)),
            ast::nop()));
    p.setLiveOut(ast::topLevelBindings(program.get()));
    auto tagged = p.compile(std::move(program));
    REQUIRE(tagged);
    CHECK_EQ(dumpIR(tagged.get()), "a := 1  # {a}\nb := a + 1  # {a, b}\n");
}

TEST_CASE("Pipeline shared name generator") {
    Pipeline p(std::make_shared<ErrorReporter>(true));
    NameGenerator names;
    auto program = []() {
        return ast::var("a", ast::literal(1), ast::loop(ast::compare(ast::ident("a"), ast::kGt, ast::literal(0)),
                ast::assign("a", ast::literal(0))));
    };
    REQUIRE(p.compile(program(), &names));
    CHECK_EQ(names.count(), 2);
    REQUIRE(p.compile(program(), &names));
    CHECK_EQ(names.count(), 4);
}

} // namespace strata
