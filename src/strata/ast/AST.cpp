#include "strata/ast/AST.hpp"

#include <algorithm>
#include <cassert>

namespace {

template <typename T>
std::vector<std::unique_ptr<strata::ast::ExprAST>> cloneAll(const std::vector<std::unique_ptr<T>>& exprs) {
    std::vector<std::unique_ptr<strata::ast::ExprAST>> copies;
    copies.reserve(exprs.size());
    for (const auto& expr : exprs) {
        copies.emplace_back(strata::ast::clone(expr.get()));
    }
    return copies;
}

bool equalAll(const std::vector<std::unique_ptr<strata::ast::ExprAST>>& a,
        const std::vector<std::unique_ptr<strata::ast::ExprAST>>& b) {
    if (a.size() != b.size()) { return false; }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!strata::ast::equal(a[i].get(), b[i].get())) { return false; }
    }
    return true;
}

} // namespace

namespace strata {
namespace ast {

std::unique_ptr<ExprAST> clone(const ExprAST* expr) {
    switch (expr->exprType) {
    case kBinaryOp: {
        auto binop = static_cast<const BinaryOpAST*>(expr);
        return std::make_unique<BinaryOpAST>(clone(binop->lhs.get()), binop->op, clone(binop->rhs.get()));
    }

    case kCall: {
        auto call = static_cast<const CallAST*>(expr);
        return std::make_unique<CallAST>(call->name, cloneAll(call->arguments));
    }

    case kIdentifier:
        return std::make_unique<IdentifierAST>(static_cast<const IdentifierAST*>(expr)->name);

    case kIntegerLiteral:
        return std::make_unique<IntegerLiteralAST>(static_cast<const IntegerLiteralAST*>(expr)->value);
    }

    assert(false);
    return nullptr;
}

std::unique_ptr<BoolAST> clone(const BoolAST* cond) {
    switch (cond->boolType) {
    case kAnd: {
        auto andAST = static_cast<const AndAST*>(cond);
        return std::make_unique<AndAST>(clone(andAST->lhs.get()), clone(andAST->rhs.get()));
    }

    case kCompare: {
        auto compare = static_cast<const CompareAST*>(cond);
        return std::make_unique<CompareAST>(clone(compare->lhs.get()), compare->relOp, clone(compare->rhs.get()));
    }

    case kFlag:
        return std::make_unique<FlagAST>(static_cast<const FlagAST*>(cond)->name);

    case kNot:
        return std::make_unique<NotAST>(clone(static_cast<const NotAST*>(cond)->operand.get()));

    case kOr: {
        auto orAST = static_cast<const OrAST*>(cond);
        return std::make_unique<OrAST>(clone(orAST->lhs.get()), clone(orAST->rhs.get()));
    }
    }

    assert(false);
    return nullptr;
}

std::unique_ptr<StmtAST> clone(const StmtAST* stmt) {
    switch (stmt->stmtType) {
    case kConditional: {
        auto conditional = static_cast<const ConditionalAST*>(stmt);
        return std::make_unique<ConditionalAST>(clone(conditional->condition.get()),
                clone(conditional->thenBlock.get()), clone(conditional->elseBlock.get()));
    }

    case kFunctionDef: {
        auto def = static_cast<const FunctionDefAST*>(stmt);
        return std::make_unique<FunctionDefAST>(def->name, def->parameters, clone(def->body.get()),
                clone(def->rest.get()));
    }

    case kLoop: {
        auto loop = static_cast<const LoopAST*>(stmt);
        return std::make_unique<LoopAST>(clone(loop->condition.get()), clone(loop->body.get()));
    }

    case kMultiAssign: {
        auto assign = static_cast<const MultiAssignAST*>(stmt);
        return std::make_unique<MultiAssignAST>(assign->names, clone(assign->value.get()));
    }

    case kNop:
        return std::make_unique<NopAST>();

    case kReturn:
        return std::make_unique<ReturnAST>(cloneAll(static_cast<const ReturnAST*>(stmt)->values));

    case kScopedBinding: {
        auto binding = static_cast<const ScopedBindingAST*>(stmt);
        return std::make_unique<ScopedBindingAST>(binding->name, clone(binding->value.get()),
                clone(binding->rest.get()));
    }

    case kSequence: {
        auto sequence = static_cast<const SequenceAST*>(stmt);
        return std::make_unique<SequenceAST>(clone(sequence->first.get()), clone(sequence->second.get()));
    }
    }

    assert(false);
    return nullptr;
}

bool equal(const ExprAST* a, const ExprAST* b) {
    if (a->exprType != b->exprType) { return false; }

    switch (a->exprType) {
    case kBinaryOp: {
        auto binopA = static_cast<const BinaryOpAST*>(a);
        auto binopB = static_cast<const BinaryOpAST*>(b);
        return binopA->op == binopB->op && equal(binopA->lhs.get(), binopB->lhs.get())
            && equal(binopA->rhs.get(), binopB->rhs.get());
    }

    case kCall: {
        auto callA = static_cast<const CallAST*>(a);
        auto callB = static_cast<const CallAST*>(b);
        return callA->name == callB->name && equalAll(callA->arguments, callB->arguments);
    }

    case kIdentifier:
        return static_cast<const IdentifierAST*>(a)->name == static_cast<const IdentifierAST*>(b)->name;

    case kIntegerLiteral:
        return static_cast<const IntegerLiteralAST*>(a)->value == static_cast<const IntegerLiteralAST*>(b)->value;
    }

    return false;
}

bool equal(const BoolAST* a, const BoolAST* b) {
    if (a->boolType != b->boolType) { return false; }

    switch (a->boolType) {
    case kAnd: {
        auto andA = static_cast<const AndAST*>(a);
        auto andB = static_cast<const AndAST*>(b);
        return equal(andA->lhs.get(), andB->lhs.get()) && equal(andA->rhs.get(), andB->rhs.get());
    }

    case kCompare: {
        auto compareA = static_cast<const CompareAST*>(a);
        auto compareB = static_cast<const CompareAST*>(b);
        return compareA->relOp == compareB->relOp && equal(compareA->lhs.get(), compareB->lhs.get())
            && equal(compareA->rhs.get(), compareB->rhs.get());
    }

    case kFlag:
        return static_cast<const FlagAST*>(a)->name == static_cast<const FlagAST*>(b)->name;

    case kNot:
        return equal(static_cast<const NotAST*>(a)->operand.get(), static_cast<const NotAST*>(b)->operand.get());

    case kOr: {
        auto orA = static_cast<const OrAST*>(a);
        auto orB = static_cast<const OrAST*>(b);
        return equal(orA->lhs.get(), orB->lhs.get()) && equal(orA->rhs.get(), orB->rhs.get());
    }
    }

    return false;
}

bool equal(const StmtAST* a, const StmtAST* b) {
    if (a->stmtType != b->stmtType) { return false; }

    switch (a->stmtType) {
    case kConditional: {
        auto condA = static_cast<const ConditionalAST*>(a);
        auto condB = static_cast<const ConditionalAST*>(b);
        return equal(condA->condition.get(), condB->condition.get())
            && equal(condA->thenBlock.get(), condB->thenBlock.get())
            && equal(condA->elseBlock.get(), condB->elseBlock.get());
    }

    case kFunctionDef: {
        auto defA = static_cast<const FunctionDefAST*>(a);
        auto defB = static_cast<const FunctionDefAST*>(b);
        return defA->name == defB->name && defA->parameters == defB->parameters
            && equal(defA->body.get(), defB->body.get()) && equal(defA->rest.get(), defB->rest.get());
    }

    case kLoop: {
        auto loopA = static_cast<const LoopAST*>(a);
        auto loopB = static_cast<const LoopAST*>(b);
        return equal(loopA->condition.get(), loopB->condition.get()) && equal(loopA->body.get(), loopB->body.get());
    }

    case kMultiAssign: {
        auto assignA = static_cast<const MultiAssignAST*>(a);
        auto assignB = static_cast<const MultiAssignAST*>(b);
        return assignA->names == assignB->names && equal(assignA->value.get(), assignB->value.get());
    }

    case kNop:
        return true;

    case kReturn:
        return equalAll(static_cast<const ReturnAST*>(a)->values, static_cast<const ReturnAST*>(b)->values);

    case kScopedBinding: {
        auto bindingA = static_cast<const ScopedBindingAST*>(a);
        auto bindingB = static_cast<const ScopedBindingAST*>(b);
        return bindingA->name == bindingB->name && equal(bindingA->value.get(), bindingB->value.get())
            && equal(bindingA->rest.get(), bindingB->rest.get());
    }

    case kSequence: {
        auto seqA = static_cast<const SequenceAST*>(a);
        auto seqB = static_cast<const SequenceAST*>(b);
        return equal(seqA->first.get(), seqB->first.get()) && equal(seqA->second.get(), seqB->second.get());
    }
    }

    return false;
}

size_t returnArity(const StmtAST* body) {
    switch (body->stmtType) {
    case kConditional: {
        auto conditional = static_cast<const ConditionalAST*>(body);
        return std::max(returnArity(conditional->thenBlock.get()), returnArity(conditional->elseBlock.get()));
    }

    case kFunctionDef:
        return returnArity(static_cast<const FunctionDefAST*>(body)->rest.get());

    case kLoop:
        return returnArity(static_cast<const LoopAST*>(body)->body.get());

    case kMultiAssign:
    case kNop:
        return 0;

    case kReturn:
        return static_cast<const ReturnAST*>(body)->values.size();

    case kScopedBinding:
        return returnArity(static_cast<const ScopedBindingAST*>(body)->rest.get());

    case kSequence: {
        auto sequence = static_cast<const SequenceAST*>(body);
        return std::max(returnArity(sequence->first.get()), returnArity(sequence->second.get()));
    }
    }

    return 0;
}

std::set<std::string> topLevelBindings(const StmtAST* program) {
    std::set<std::string> names;
    std::vector<const StmtAST*> pending{program};
    while (!pending.empty()) {
        auto stmt = pending.back();
        pending.pop_back();
        switch (stmt->stmtType) {
        case kFunctionDef:
            pending.emplace_back(static_cast<const FunctionDefAST*>(stmt)->rest.get());
            break;

        case kScopedBinding: {
            auto binding = static_cast<const ScopedBindingAST*>(stmt);
            names.emplace(binding->name);
            pending.emplace_back(binding->rest.get());
        } break;

        case kSequence: {
            auto sequence = static_cast<const SequenceAST*>(stmt);
            pending.emplace_back(sequence->second.get());
            pending.emplace_back(sequence->first.get());
        } break;

        case kConditional:
        case kLoop:
        case kMultiAssign:
        case kNop:
        case kReturn:
            break;
        }
    }
    return names;
}

} // namespace ast
} // namespace strata
