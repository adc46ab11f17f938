#include "strata/Normalizer.hpp"

#include "spdlog/spdlog.h"

namespace {

template <typename T>
T* as(const std::unique_ptr<strata::ast::StmtAST>& stmt) {
    return static_cast<T*>(stmt.get());
}

} // namespace

namespace strata {

// static
std::unique_ptr<ast::StmtAST> Normalizer::precompile(std::unique_ptr<ast::StmtAST> stmt) {
    return removeDeadBranches(absorbBranches(leftify(std::move(stmt))));
}

// static
std::unique_ptr<ast::StmtAST> Normalizer::leftify(std::unique_ptr<ast::StmtAST> stmt) {
    switch (stmt->stmtType) {
    case ast::kSequence: {
        auto sequence = as<ast::SequenceAST>(stmt);
        while (sequence->first->stmtType == ast::kSequence) {
            // Sequence(Sequence(a, b), c) becomes Sequence(a, Sequence(b, c)), reusing the inner node.
            std::unique_ptr<ast::SequenceAST> inner(static_cast<ast::SequenceAST*>(sequence->first.release()));
            sequence->first = std::move(inner->first);
            inner->first = std::move(inner->second);
            inner->second = std::move(sequence->second);
            sequence->second = std::move(inner);
        }
        sequence->first = leftify(std::move(sequence->first));
        sequence->second = leftify(std::move(sequence->second));
    } break;

    case ast::kFunctionDef: {
        auto def = as<ast::FunctionDefAST>(stmt);
        def->body = leftify(std::move(def->body));
        def->rest = leftify(std::move(def->rest));
    } break;

    case ast::kLoop: {
        auto loop = as<ast::LoopAST>(stmt);
        loop->body = leftify(std::move(loop->body));
    } break;

    case ast::kConditional: {
        auto conditional = as<ast::ConditionalAST>(stmt);
        conditional->thenBlock = leftify(std::move(conditional->thenBlock));
        conditional->elseBlock = leftify(std::move(conditional->elseBlock));
    } break;

    case ast::kScopedBinding: {
        auto binding = as<ast::ScopedBindingAST>(stmt);
        binding->rest = leftify(std::move(binding->rest));
    } break;

    case ast::kMultiAssign:
    case ast::kNop:
    case ast::kReturn:
        break;
    }

    return stmt;
}

// static
std::unique_ptr<ast::StmtAST> Normalizer::absorbBranches(std::unique_ptr<ast::StmtAST> stmt) {
    switch (stmt->stmtType) {
    case ast::kSequence: {
        auto sequence = as<ast::SequenceAST>(stmt);
        if (sequence->first->stmtType == ast::kNop) { return absorbBranches(std::move(sequence->second)); }
        if (sequence->second->stmtType == ast::kNop) { return absorbBranches(std::move(sequence->first)); }

        if (sequence->first->stmtType == ast::kConditional) {
            auto conditional = as<ast::ConditionalAST>(sequence->first);
            auto thenBlock = absorbBranches(std::move(conditional->thenBlock));
            auto elseBlock = absorbBranches(std::move(conditional->elseBlock));
            auto tail = absorbBranches(std::move(sequence->second));
            auto tailCopy = ast::clone(tail.get());

            conditional->thenBlock = absorbBranches(leftify(std::make_unique<ast::SequenceAST>(std::move(thenBlock),
                    std::move(tail))));
            conditional->elseBlock = absorbBranches(leftify(std::make_unique<ast::SequenceAST>(std::move(elseBlock),
                    std::move(tailCopy))));
            return std::move(sequence->first);
        }

        sequence->first = absorbBranches(std::move(sequence->first));
        sequence->second = absorbBranches(std::move(sequence->second));
        // The tail can collapse to a Nop, as in Sequence(a, Sequence(Nop, Nop)).
        if (sequence->second->stmtType == ast::kNop) { return std::move(sequence->first); }
        return leftify(std::move(stmt));
    }

    case ast::kFunctionDef: {
        auto def = as<ast::FunctionDefAST>(stmt);
        def->body = absorbBranches(std::move(def->body));
        def->rest = absorbBranches(std::move(def->rest));
    } break;

    case ast::kLoop: {
        auto loop = as<ast::LoopAST>(stmt);
        loop->body = absorbBranches(std::move(loop->body));
    } break;

    case ast::kConditional: {
        auto conditional = as<ast::ConditionalAST>(stmt);
        conditional->thenBlock = absorbBranches(std::move(conditional->thenBlock));
        conditional->elseBlock = absorbBranches(std::move(conditional->elseBlock));
    } break;

    case ast::kScopedBinding: {
        auto binding = as<ast::ScopedBindingAST>(stmt);
        binding->rest = absorbBranches(std::move(binding->rest));
    } break;

    case ast::kMultiAssign:
    case ast::kNop:
    case ast::kReturn:
        break;
    }

    return stmt;
}

// static
bool Normalizer::returns(const ast::StmtAST* stmt) {
    switch (stmt->stmtType) {
    case ast::kConditional: {
        auto conditional = static_cast<const ast::ConditionalAST*>(stmt);
        return returns(conditional->thenBlock.get()) || returns(conditional->elseBlock.get());
    }

    case ast::kFunctionDef: {
        auto def = static_cast<const ast::FunctionDefAST*>(stmt);
        return returns(def->body.get()) || returns(def->rest.get());
    }

    case ast::kLoop:
        return returns(static_cast<const ast::LoopAST*>(stmt)->body.get());

    case ast::kMultiAssign:
    case ast::kNop:
        return false;

    case ast::kReturn:
        return true;

    case ast::kScopedBinding:
        return returns(static_cast<const ast::ScopedBindingAST*>(stmt)->rest.get());

    case ast::kSequence: {
        auto sequence = static_cast<const ast::SequenceAST*>(stmt);
        return returns(sequence->first.get()) || returns(sequence->second.get());
    }
    }

    return false;
}

// static
std::unique_ptr<ast::StmtAST> Normalizer::removeDeadBranches(std::unique_ptr<ast::StmtAST> stmt) {
    switch (stmt->stmtType) {
    case ast::kSequence: {
        auto sequence = as<ast::SequenceAST>(stmt);
        if (returns(sequence->first.get())) {
            SPDLOG_TRACE("Normalizer removing unreachable code after return");
            return removeDeadBranches(std::move(sequence->first));
        }
        sequence->first = removeDeadBranches(std::move(sequence->first));
        sequence->second = removeDeadBranches(std::move(sequence->second));
    } break;

    case ast::kFunctionDef: {
        auto def = as<ast::FunctionDefAST>(stmt);
        def->body = removeDeadBranches(std::move(def->body));
        def->rest = removeDeadBranches(std::move(def->rest));
    } break;

    case ast::kLoop: {
        auto loop = as<ast::LoopAST>(stmt);
        loop->body = removeDeadBranches(std::move(loop->body));
    } break;

    case ast::kConditional: {
        auto conditional = as<ast::ConditionalAST>(stmt);
        conditional->thenBlock = removeDeadBranches(std::move(conditional->thenBlock));
        conditional->elseBlock = removeDeadBranches(std::move(conditional->elseBlock));
    } break;

    case ast::kScopedBinding: {
        auto binding = as<ast::ScopedBindingAST>(stmt);
        binding->rest = removeDeadBranches(std::move(binding->rest));
    } break;

    case ast::kMultiAssign:
    case ast::kNop:
    case ast::kReturn:
        break;
    }

    return stmt;
}

} // namespace strata
