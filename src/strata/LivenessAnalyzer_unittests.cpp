#include "strata/LivenessAnalyzer.hpp"

#include "strata/Dump.hpp"
#include "strata/ir/Builders.hpp"
#include "strata/Validator.hpp"

#include "doctest/doctest.h"

#include <algorithm>

namespace strata {

TEST_CASE("LivenessAnalyzer straight line") {
    LivenessAnalyzer analyzer;

    SUBCASE("dead store is removed") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("x", ast::literal(1)), ir::assign("y", ast::literal(2)),
                ir::assign("z", ast::ident("x"))), {"z"});
        CHECK_EQ(dumpIR(tagged.get()), "x := 1  # {x}\nz := x  # {z}\n");
        CHECK(Validator::validateLiveness(tagged.get()));
    }
    SUBCASE("overwritten store is removed") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("x", ast::literal(1)), ir::assign("x", ast::literal(2)),
                ir::assign("z", ast::add(ast::ident("x"), ast::ident("w")))), {"z"});
        CHECK_EQ(dumpIR(tagged.get()), "x := 2  # {w, x}\nz := x + w  # {z}\n");
    }
    SUBCASE("everything dead") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("x", ast::literal(1))));
        REQUIRE_EQ(tagged->opcode, ir::kSequence);
        CHECK(static_cast<const ir::SequenceIR*>(tagged.get())->instructions.empty());
    }
    SUBCASE("single dead assignment") {
        auto tagged = analyzer.analyze(ir::assign("x", ast::literal(1)));
        REQUIRE_EQ(tagged->opcode, ir::kSequence);
        CHECK(static_cast<const ir::SequenceIR*>(tagged.get())->instructions.empty());
    }
}

TEST_CASE("LivenessAnalyzer control flow") {
    LivenessAnalyzer analyzer;

    SUBCASE("compare only keeps the flags the guard reads") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("a1", ast::ident("x")), ir::assign("b1", ast::ident("y")),
                ir::compare("a1", "b1"), ir::ifElse(ir::flag("b1"), ir::assign("z", ast::literal(1)),
                ir::assign("z", ast::literal(2)))), {"z"});
        CHECK_EQ(dumpIR(tagged.get()),
                "b1 := y  # {b1}\n"
                "cmp a1, b1  # {b1}\n"
                "if @b1 {  # {z}\n"
                "  z := 1  # {z}\n"
                "} else {\n"
                "  z := 2  # {z}\n"
                "}\n");
        CHECK(Validator::validateLiveness(tagged.get()));
    }
    SUBCASE("dead branch assignment leaves an empty block") {
        auto tagged = analyzer.analyze(ir::seq(ir::ifElse(ir::flag("f"), ir::assign("u", ast::literal(1)),
                ir::assign("z", ast::literal(2))), ir::assign("r", ast::ident("z"))), {"r"});
        CHECK_EQ(dumpIR(tagged.get()),
                "if @f {  # {z}\n"
                "} else {\n"
                "  z := 2  # {z}\n"
                "}\n"
                "r := z  # {r}\n");
        CHECK(Validator::validateLiveness(tagged.get()));
    }
    SUBCASE("loop reaches a fixpoint") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("i", ast::literal(0)), ir::assign("s", ast::literal(0)),
                ir::loop(ir::flag("c"), ir::seq(ir::assign("s", ast::add(ast::ident("s"), ast::ident("i"))),
                ir::assign("i", ast::add(ast::ident("i"), ast::literal(1)))))), {"s"});
        CHECK_EQ(dumpIR(tagged.get()),
                "i := 0  # {c, i, s}\n"
                "s := 0  # {c, i, s}\n"
                "while @c {  # {c, i, s}\n"
                "  s := s + i  # {c, i, s}\n"
                "  i := i + 1  # {c, i, s}\n"
                "}\n");
        CHECK(Validator::validateLiveness(tagged.get()));

        REQUIRE_EQ(tagged->opcode, ir::kSequence);
        auto loop = static_cast<const ir::LoopIR*>(
                static_cast<const ir::SequenceIR*>(tagged.get())->instructions.back().get());
        REQUIRE_EQ(loop->opcode, ir::kLoop);

        // Running the fixpoint again from the same exit set changes nothing.
        CHECK_EQ(LivenessAnalyzer::loopFixpoint(loop, {"s"}), loop->liveness());
        // One more pass through the body needs nothing the tag doesn't already hold.
        auto onePass = LivenessAnalyzer::liveBefore(loop->body.get(), loop->liveness());
        CHECK(std::includes(loop->liveness().begin(), loop->liveness().end(), onePass.begin(), onePass.end()));
    }
    SUBCASE("loop variable only needed after the loop") {
        auto tagged = analyzer.analyze(ir::seq(ir::loop(ir::flag("c"), ir::assign("t", ast::ident("u"))),
                ir::assign("r", ast::ident("t"))), {"r"});
        CHECK_EQ(dumpIR(tagged.get()),
                "while @c {  # {c, t, u}\n"
                "  t := u  # {c, t, u}\n"
                "}\n"
                "r := t  # {r}\n");
    }
    SUBCASE("parallel branches share the same exit set") {
        auto tagged = analyzer.analyze(ir::seq(ir::par(ir::assign("a", ast::ident("x")),
                ir::assign("b", ast::ident("y"))), ir::assign("c", ast::add(ast::ident("a"), ast::ident("b")))),
                {"c"});
        CHECK_EQ(dumpIR(tagged.get()),
                "par {\n"
                "  a := x  # {a, b}\n"
                "  b := y  # {a, b}\n"
                "}\n"
                "c := a + b  # {c}\n");
        CHECK(Validator::validateLiveness(tagged.get()));
        // Each branch sees the names the other defines as live on entry.
        ir::LiveSet expected{"a", "b", "x", "y"};
        CHECK_EQ(LivenessAnalyzer::liveBefore(tagged.get(), {"c"}), expected);
    }
    SUBCASE("empty parallel needs nothing") {
        auto parallel = ir::par();
        CHECK(LivenessAnalyzer::liveBefore(parallel.get(), {"x"}).empty());

        auto tagged = analyzer.analyze(ir::seq(ir::assign("x", ast::literal(1)), ir::par(),
                ir::assign("r", ast::ident("x"))), {"r"});
        CHECK_EQ(dumpIR(tagged.get()),
                "par {\n"
                "}\n"
                "r := x  # {r}\n");
    }
    SUBCASE("tagged instructions are not tagged again") {
        auto tagged = analyzer.analyze(ir::seq(ir::assign("x", ast::literal(1)), ir::assign("z", ast::ident("x"))),
                {"z"});
        auto again = analyzer.analyze(ir::clone(tagged.get()), {"z", "x"});
        CHECK_EQ(dumpIR(again.get()), dumpIR(tagged.get()));
    }
}

} // namespace strata
