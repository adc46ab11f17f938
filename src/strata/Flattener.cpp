#include "strata/Flattener.hpp"

namespace strata {

std::unique_ptr<ir::IR> Flattener::flatten(std::unique_ptr<ir::IR> block) {
    ir::IRList instructions;
    splice(std::move(block), instructions);
    if (instructions.size() == 1) {
        return std::move(instructions.front());
    }
    return std::make_unique<ir::SequenceIR>(std::move(instructions));
}

void Flattener::splice(std::unique_ptr<ir::IR> ir, ir::IRList& instructions) {
    switch (ir->opcode) {
    case ir::kSequence: {
        auto sequence = static_cast<ir::SequenceIR*>(ir.get());
        for (auto& instruction : sequence->instructions) {
            splice(std::move(instruction), instructions);
        }
        return;
    }

    case ir::kConditional: {
        auto conditional = static_cast<ir::ConditionalIR*>(ir.get());
        conditional->thenBlock = flatten(std::move(conditional->thenBlock));
        conditional->elseBlock = flatten(std::move(conditional->elseBlock));
    } break;

    case ir::kLoop: {
        auto loop = static_cast<ir::LoopIR*>(ir.get());
        loop->body = flatten(std::move(loop->body));
    } break;

    case ir::kParallel: {
        auto parallel = static_cast<ir::ParallelIR*>(ir.get());
        for (auto& branch : parallel->branches) {
            branch = flatten(std::move(branch));
        }
    } break;

    case ir::kAssign:
    case ir::kCompare:
        break;
    }

    instructions.emplace_back(std::move(ir));
}

} // namespace strata
