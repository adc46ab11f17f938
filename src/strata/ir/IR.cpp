#include "strata/ir/IR.hpp"

namespace strata {
namespace ir {

std::unique_ptr<IR> clone(const IR* ir) {
    std::unique_ptr<IR> copy;
    switch (ir->opcode) {
    case kAssign: {
        auto assign = static_cast<const AssignIR*>(ir);
        copy = std::make_unique<AssignIR>(assign->name, ast::clone(assign->value.get()));
    } break;

    case kCompare: {
        auto compare = static_cast<const CompareIR*>(ir);
        copy = std::make_unique<CompareIR>(compare->lhs, compare->rhs);
    } break;

    case kConditional: {
        auto conditional = static_cast<const ConditionalIR*>(ir);
        copy = std::make_unique<ConditionalIR>(ast::clone(conditional->condition.get()),
                clone(conditional->thenBlock.get()), clone(conditional->elseBlock.get()));
    } break;

    case kLoop: {
        auto loop = static_cast<const LoopIR*>(ir);
        copy = std::make_unique<LoopIR>(ast::clone(loop->condition.get()), clone(loop->body.get()));
    } break;

    case kParallel:
        return std::make_unique<ParallelIR>(clone(static_cast<const ParallelIR*>(ir)->branches));

    case kSequence:
        return std::make_unique<SequenceIR>(clone(static_cast<const SequenceIR*>(ir)->instructions));
    }

    if (ir->isTagged()) { copy->setLiveness(ir->liveness()); }
    return copy;
}

IRList clone(const IRList& instructions) {
    IRList copies;
    for (const auto& ir : instructions) {
        copies.emplace_back(clone(ir.get()));
    }
    return copies;
}

void collectReads(const ast::ExprAST* expr, LiveSet& names) {
    switch (expr->exprType) {
    case ast::kBinaryOp: {
        auto binop = static_cast<const ast::BinaryOpAST*>(expr);
        collectReads(binop->lhs.get(), names);
        collectReads(binop->rhs.get(), names);
    } break;

    case ast::kCall:
        for (const auto& arg : static_cast<const ast::CallAST*>(expr)->arguments) {
            collectReads(arg.get(), names);
        }
        break;

    case ast::kIdentifier:
        names.emplace(static_cast<const ast::IdentifierAST*>(expr)->name);
        break;

    case ast::kIntegerLiteral:
        break;
    }
}

void collectReads(const ast::BoolAST* cond, LiveSet& names) {
    switch (cond->boolType) {
    case ast::kAnd: {
        auto andAST = static_cast<const ast::AndAST*>(cond);
        collectReads(andAST->lhs.get(), names);
        collectReads(andAST->rhs.get(), names);
    } break;

    case ast::kCompare: {
        auto compare = static_cast<const ast::CompareAST*>(cond);
        collectReads(compare->lhs.get(), names);
        collectReads(compare->rhs.get(), names);
    } break;

    case ast::kFlag:
        names.emplace(static_cast<const ast::FlagAST*>(cond)->name);
        break;

    case ast::kNot:
        collectReads(static_cast<const ast::NotAST*>(cond)->operand.get(), names);
        break;

    case ast::kOr: {
        auto orAST = static_cast<const ast::OrAST*>(cond);
        collectReads(orAST->lhs.get(), names);
        collectReads(orAST->rhs.get(), names);
    } break;
    }
}

} // namespace ir
} // namespace strata
