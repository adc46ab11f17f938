#include "strata/Flattener.hpp"

#include "strata/Dump.hpp"
#include "strata/ir/Builders.hpp"
#include "strata/Validator.hpp"

#include "doctest/doctest.h"

namespace strata {

TEST_CASE("Flattener") {
    Flattener flattener;

    SUBCASE("nested sequences splice into one") {
        auto flat = flattener.flatten(ir::seq(ir::seq(ir::assign("a", ast::literal(1)),
                ir::seq(ir::assign("b", ast::literal(2)))), ir::assign("c", ast::literal(3))));
        REQUIRE_EQ(flat->opcode, ir::kSequence);
        CHECK_EQ(static_cast<const ir::SequenceIR*>(flat.get())->instructions.size(), 3);
        CHECK_EQ(dumpIR(flat.get()), "a := 1\nb := 2\nc := 3\n");
        CHECK(Validator::validateFlattened(flat.get()));
    }
    SUBCASE("single instruction is unwrapped") {
        auto flat = flattener.flatten(ir::seq(ir::seq(ir::assign("a", ast::literal(1)))));
        CHECK_EQ(flat->opcode, ir::kAssign);
        CHECK(Validator::validateFlattened(flat.get()));
    }
    SUBCASE("empty sequence stays empty") {
        auto flat = flattener.flatten(ir::seq(ir::seq(), ir::seq(ir::seq())));
        REQUIRE_EQ(flat->opcode, ir::kSequence);
        CHECK(static_cast<const ir::SequenceIR*>(flat.get())->instructions.empty());
    }
    SUBCASE("branches are flattened but not spliced") {
        auto flat = flattener.flatten(ir::seq(ir::ifElse(ir::flag("f"),
                ir::seq(ir::seq(ir::assign("x", ast::literal(1)))),
                ir::seq(ir::assign("x", ast::literal(2)), ir::seq(ir::assign("y", ast::literal(3))))),
                ir::seq(ir::assign("z", ast::ident("x")))));
        CHECK_EQ(dumpIR(flat.get()),
                "if @f {\n"
                "  x := 1\n"
                "} else {\n"
                "  x := 2\n"
                "  y := 3\n"
                "}\n"
                "z := x\n");
        REQUIRE_EQ(flat->opcode, ir::kSequence);
        auto conditional = static_cast<const ir::ConditionalIR*>(
                static_cast<const ir::SequenceIR*>(flat.get())->instructions.front().get());
        CHECK_EQ(conditional->thenBlock->opcode, ir::kAssign);
        CHECK(Validator::validateFlattened(flat.get()));
    }
    SUBCASE("loop bodies and parallel branches") {
        auto flat = flattener.flatten(ir::loop(ir::flag("c"), ir::seq(ir::seq(ir::assign("i", ast::literal(0))),
                ir::par(ir::seq(ir::seq(ir::assign("a", ast::literal(1)))), ir::seq(ir::assign("b",
                ast::literal(2)), ir::seq(ir::assign("c", ast::literal(3))))))));
        CHECK_EQ(dumpIR(flat.get()),
                "while @c {\n"
                "  i := 0\n"
                "  par {\n"
                "    a := 1\n"
                "    seq {\n"
                "      b := 2\n"
                "      c := 3\n"
                "    }\n"
                "  }\n"
                "}\n");
        CHECK(Validator::validateFlattened(flat.get()));
    }
}

} // namespace strata
