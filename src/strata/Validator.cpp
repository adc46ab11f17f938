#include "strata/Validator.hpp"

#include "strata/Normalizer.hpp"

#include "spdlog/spdlog.h"

namespace strata {

// static
bool Validator::validatePrecompiled(const ast::StmtAST* stmt, const std::string& reservedPrefix) {
    switch (stmt->stmtType) {
    case ast::kSequence: {
        auto sequence = static_cast<const ast::SequenceAST*>(stmt);
        if (sequence->first->stmtType == ast::kSequence) {
            SPDLOG_ERROR("Sequence with a Sequence as its first statement");
            return false;
        }
        if (sequence->first->stmtType == ast::kConditional) {
            SPDLOG_ERROR("Sequence with a Conditional as its first statement");
            return false;
        }
        if (sequence->first->stmtType == ast::kNop || sequence->second->stmtType == ast::kNop) {
            SPDLOG_ERROR("Sequence containing a Nop");
            return false;
        }
        if (Normalizer::returns(sequence->first.get())) {
            SPDLOG_ERROR("Unreachable statement after return");
            return false;
        }
        return validatePrecompiled(sequence->first.get(), reservedPrefix) &&
                validatePrecompiled(sequence->second.get(), reservedPrefix);
    }

    case ast::kConditional: {
        auto conditional = static_cast<const ast::ConditionalAST*>(stmt);
        return validatePrecompiled(conditional->thenBlock.get(), reservedPrefix) &&
                validatePrecompiled(conditional->elseBlock.get(), reservedPrefix);
    }

    case ast::kFunctionDef: {
        auto def = static_cast<const ast::FunctionDefAST*>(stmt);
        for (const auto& parameter : def->parameters) {
            if (isReserved(parameter, reservedPrefix)) {
                SPDLOG_ERROR("Parameter '{}' of function '{}' uses the generated name prefix", parameter, def->name);
                return false;
            }
        }
        return validatePrecompiled(def->body.get(), reservedPrefix) &&
                validatePrecompiled(def->rest.get(), reservedPrefix);
    }

    case ast::kLoop:
        return validatePrecompiled(static_cast<const ast::LoopAST*>(stmt)->body.get(), reservedPrefix);

    case ast::kScopedBinding: {
        auto binding = static_cast<const ast::ScopedBindingAST*>(stmt);
        if (isReserved(binding->name, reservedPrefix)) {
            SPDLOG_ERROR("Binding '{}' uses the generated name prefix", binding->name);
            return false;
        }
        return validatePrecompiled(binding->rest.get(), reservedPrefix);
    }

    case ast::kMultiAssign:
    case ast::kNop:
    case ast::kReturn:
        return true;
    }

    return false;
}

// static
bool Validator::validateInlined(const ir::IR* ir) {
    if (ir->isTagged()) {
        SPDLOG_ERROR("Inlined IR already carries liveness tags");
        return false;
    }

    switch (ir->opcode) {
    case ir::kAssign:
        return validateLoweredExpr(static_cast<const ir::AssignIR*>(ir)->value.get());

    case ir::kCompare:
        return true;

    case ir::kConditional: {
        auto conditional = static_cast<const ir::ConditionalIR*>(ir);
        return validateLoweredBool(conditional->condition.get()) && validateInlined(conditional->thenBlock.get())
            && validateInlined(conditional->elseBlock.get());
    }

    case ir::kLoop: {
        auto loop = static_cast<const ir::LoopIR*>(ir);
        return validateLoweredBool(loop->condition.get()) && validateInlined(loop->body.get());
    }

    case ir::kParallel:
        for (const auto& branch : static_cast<const ir::ParallelIR*>(ir)->branches) {
            if (!validateInlined(branch.get())) { return false; }
        }
        return true;

    case ir::kSequence:
        for (const auto& instruction : static_cast<const ir::SequenceIR*>(ir)->instructions) {
            if (!validateInlined(instruction.get())) { return false; }
        }
        return true;
    }

    return false;
}

// static
bool Validator::validateFlattened(const ir::IR* ir) {
    return validateFlatBlock(ir);
}

// static
bool Validator::validateLiveness(const ir::IR* ir) {
    switch (ir->opcode) {
    case ir::kParallel:
        if (ir->isTagged()) {
            SPDLOG_ERROR("Parallel carries a liveness tag");
            return false;
        }
        for (const auto& branch : static_cast<const ir::ParallelIR*>(ir)->branches) {
            if (!validateLiveness(branch.get())) { return false; }
        }
        return true;

    case ir::kSequence:
        if (ir->isTagged()) {
            SPDLOG_ERROR("Sequence carries a liveness tag");
            return false;
        }
        for (const auto& instruction : static_cast<const ir::SequenceIR*>(ir)->instructions) {
            if (!validateLiveness(instruction.get())) { return false; }
        }
        return true;

    case ir::kAssign:
    case ir::kCompare:
    case ir::kConditional:
    case ir::kLoop:
        break;
    }

    if (!ir->isTagged()) {
        SPDLOG_ERROR("Instruction missing a liveness tag");
        return false;
    }

    switch (ir->opcode) {
    case ir::kAssign: {
        auto assign = static_cast<const ir::AssignIR*>(ir);
        if (ir->liveness().count(assign->name) == 0) {
            SPDLOG_ERROR("Assignment to '{}' survived but is never read", assign->name);
            return false;
        }
    } break;

    case ir::kConditional: {
        auto conditional = static_cast<const ir::ConditionalIR*>(ir);
        return validateLiveness(conditional->thenBlock.get()) && validateLiveness(conditional->elseBlock.get());
    }

    case ir::kLoop: {
        auto loop = static_cast<const ir::LoopIR*>(ir);
        ir::LiveSet guardReads;
        ir::collectReads(loop->condition.get(), guardReads);
        for (const auto& name : guardReads) {
            if (ir->liveness().count(name) == 0) {
                SPDLOG_ERROR("Loop guard reads '{}' which is missing from the loop liveness", name);
                return false;
            }
        }
        return validateLiveness(loop->body.get());
    }

    case ir::kCompare:
    case ir::kParallel:
    case ir::kSequence:
        break;
    }

    return true;
}

// static
bool Validator::validateLoweredExpr(const ast::ExprAST* expr) {
    switch (expr->exprType) {
    case ast::kBinaryOp: {
        auto binop = static_cast<const ast::BinaryOpAST*>(expr);
        if (binop->op != ast::kAdd) {
            SPDLOG_ERROR("Lowered expression contains an operator other than addition");
            return false;
        }
        return validateLoweredExpr(binop->lhs.get()) && validateLoweredExpr(binop->rhs.get());
    }

    case ast::kCall:
        SPDLOG_ERROR("Call to '{}' survived inlining", static_cast<const ast::CallAST*>(expr)->name);
        return false;

    case ast::kIdentifier:
    case ast::kIntegerLiteral:
        return true;
    }

    return false;
}

// static
bool Validator::validateLoweredBool(const ast::BoolAST* cond) {
    switch (cond->boolType) {
    case ast::kAnd: {
        auto andAST = static_cast<const ast::AndAST*>(cond);
        return validateLoweredBool(andAST->lhs.get()) && validateLoweredBool(andAST->rhs.get());
    }

    case ast::kCompare:
        SPDLOG_ERROR("Comparison survived lowering");
        return false;

    case ast::kFlag:
        return true;

    case ast::kNot:
        return validateLoweredBool(static_cast<const ast::NotAST*>(cond)->operand.get());

    case ast::kOr: {
        auto orAST = static_cast<const ast::OrAST*>(cond);
        return validateLoweredBool(orAST->lhs.get()) && validateLoweredBool(orAST->rhs.get());
    }
    }

    return false;
}

// static
bool Validator::validateFlatBlock(const ir::IR* block) {
    if (block->opcode == ir::kSequence) {
        auto sequence = static_cast<const ir::SequenceIR*>(block);
        if (sequence->instructions.size() == 1) {
            SPDLOG_ERROR("Block is a Sequence with a single instruction");
            return false;
        }
        for (const auto& instruction : sequence->instructions) {
            if (instruction->opcode == ir::kSequence) {
                SPDLOG_ERROR("Nested Sequence in flattened block");
                return false;
            }
            if (!validateFlatBlock(instruction.get())) { return false; }
        }
        return true;
    }

    switch (block->opcode) {
    case ir::kConditional: {
        auto conditional = static_cast<const ir::ConditionalIR*>(block);
        return validateFlatBlock(conditional->thenBlock.get()) && validateFlatBlock(conditional->elseBlock.get());
    }

    case ir::kLoop:
        return validateFlatBlock(static_cast<const ir::LoopIR*>(block)->body.get());

    case ir::kParallel:
        for (const auto& branch : static_cast<const ir::ParallelIR*>(block)->branches) {
            if (!validateFlatBlock(branch.get())) { return false; }
        }
        return true;

    case ir::kAssign:
    case ir::kCompare:
    case ir::kSequence:
        break;
    }

    return true;
}

// static
bool Validator::isReserved(const std::string& name, const std::string& reservedPrefix) {
    return !reservedPrefix.empty() && name.compare(0, reservedPrefix.size(), reservedPrefix) == 0;
}

} // namespace strata
