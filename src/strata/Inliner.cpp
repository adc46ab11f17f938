#include "strata/Inliner.hpp"

#include "strata/ErrorReporter.hpp"
#include "strata/NameGenerator.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace {

std::unique_ptr<strata::ast::BoolAST> flag(const std::string& name) {
    return std::make_unique<strata::ast::FlagAST>(name);
}

std::unique_ptr<strata::ast::BoolAST> notFlag(const std::string& name) {
    return std::make_unique<strata::ast::NotAST>(flag(name));
}

} // namespace

namespace strata {

Inliner::Inliner(std::shared_ptr<ErrorReporter> errorReporter, NameGenerator* nameGenerator):
    m_errorReporter(errorReporter),
    m_nameGenerator(nameGenerator),
    m_maxMultiplyUnroll(kDefaultMaxMultiplyUnroll) { assert(m_nameGenerator); }

std::unique_ptr<ir::IR> Inliner::inlineProgram(const ast::StmtAST* program, const FunctionTable& builtins) {
    Environment env{builtins, RenameTable(), ReturnSlots()};
    return lowerStatement(program, env);
}

std::unique_ptr<ir::IR> Inliner::lowerStatement(const ast::StmtAST* stmt, const Environment& env) {
    ir::IRList instructions;

    switch (stmt->stmtType) {
    case ast::kNop:
        break;

    // Definitions emit nothing. The function joins the table for the remainder of the program only.
    case ast::kFunctionDef: {
        auto def = static_cast<const ast::FunctionDefAST*>(stmt);
        Environment restEnv = env;
        restEnv.functions = env.functions.extend(def->name, Function(def->parameters, def->body.get(),
                env.functions));
        return lowerStatement(def->rest.get(), restEnv);
    }

    case ast::kScopedBinding: {
        auto binding = static_cast<const ast::ScopedBindingAST*>(stmt);
        auto value = lowerExpr(binding->value.get(), env, instructions);
        if (!value) { return nullptr; }

        // Only rename if this binding would shadow another one.
        auto target = env.names.contains(binding->name) ? m_nameGenerator->next() : binding->name;
        instructions.emplace_back(std::make_unique<ir::AssignIR>(target, std::move(value)));

        Environment restEnv = env;
        restEnv.names = env.names.extend(binding->name, target);
        auto rest = lowerStatement(binding->rest.get(), restEnv);
        if (!rest) { return nullptr; }
        instructions.emplace_back(std::move(rest));
    } break;

    case ast::kMultiAssign: {
        auto assign = static_cast<const ast::MultiAssignAST*>(stmt);
        if (assign->value->exprType == ast::kCall) {
            auto call = static_cast<const ast::CallAST*>(assign->value.get());
            std::vector<std::string> targets;
            for (const auto& name : assign->names) {
                auto target = findName(name, env);
                if (!target) { return nullptr; }
                targets.emplace_back(*target);
            }
            std::vector<const ast::ExprAST*> arguments;
            for (const auto& arg : call->arguments) {
                arguments.emplace_back(arg.get());
            }
            return lowerCall(call->name, arguments, targets, env);
        }

        // Anything other than a call produces exactly one value.
        if (assign->names.size() != 1) {
            m_errorReporter->addError(ErrorReporter::kArityMismatch, fmt::format("{}", fmt::join(assign->names,
                    ", ")));
            return nullptr;
        }
        auto target = findName(assign->names.front(), env);
        if (!target) { return nullptr; }
        auto value = lowerExpr(assign->value.get(), env, instructions);
        if (!value) { return nullptr; }
        instructions.emplace_back(std::make_unique<ir::AssignIR>(*target, std::move(value)));
    } break;

    case ast::kReturn: {
        auto returnAST = static_cast<const ast::ReturnAST*>(stmt);
        for (size_t i = 0; i < returnAST->values.size(); ++i) {
            ir::IRList prelude;
            auto value = lowerExpr(returnAST->values[i].get(), env, prelude);
            if (!value) { return nullptr; }
            // Values the caller does not assign are computed, to surface any errors, and then dropped.
            if (i < env.returnSlots.size() && env.returnSlots[i]) {
                instructions.splice(instructions.end(), prelude);
                instructions.emplace_back(std::make_unique<ir::AssignIR>(*env.returnSlots[i], std::move(value)));
            }
        }
    } break;

    case ast::kSequence: {
        auto sequence = static_cast<const ast::SequenceAST*>(stmt);
        auto first = lowerStatement(sequence->first.get(), env);
        if (!first) { return nullptr; }
        auto second = lowerStatement(sequence->second.get(), env);
        if (!second) { return nullptr; }
        instructions.emplace_back(std::move(first));
        instructions.emplace_back(std::move(second));
    } break;

    case ast::kLoop: {
        auto loop = static_cast<const ast::LoopAST*>(stmt);
        auto condition = lowerBool(loop->condition.get(), env, instructions);
        if (!condition) { return nullptr; }
        auto body = lowerStatement(loop->body.get(), env);
        if (!body) { return nullptr; }

        // The guard prelude runs again at the end of each iteration so the guard sees fresh values.
        ir::IRList bodyInstructions = ir::clone(instructions);
        bodyInstructions.emplace_front(std::move(body));
        instructions.emplace_back(std::make_unique<ir::LoopIR>(std::move(condition),
                std::make_unique<ir::SequenceIR>(std::move(bodyInstructions))));
    } break;

    case ast::kConditional: {
        auto conditional = static_cast<const ast::ConditionalAST*>(stmt);
        auto condition = lowerBool(conditional->condition.get(), env, instructions);
        if (!condition) { return nullptr; }
        auto thenBlock = lowerStatement(conditional->thenBlock.get(), env);
        if (!thenBlock) { return nullptr; }
        auto elseBlock = lowerStatement(conditional->elseBlock.get(), env);
        if (!elseBlock) { return nullptr; }
        instructions.emplace_back(std::make_unique<ir::ConditionalIR>(std::move(condition), std::move(thenBlock),
                std::move(elseBlock)));
    } break;
    }

    return std::make_unique<ir::SequenceIR>(std::move(instructions));
}

std::unique_ptr<ir::IR> Inliner::lowerCall(const std::string& name, const std::vector<const ast::ExprAST*>& arguments,
        const std::vector<std::string>& targets, const Environment& env) {
    auto function = env.functions.find(name);
    if (!function) {
        m_errorReporter->addError(ErrorReporter::kUndefinedFunction, name);
        return nullptr;
    }
    if (arguments.size() != function->parameters.size() || targets.size() > ast::returnArity(function->body)) {
        m_errorReporter->addError(ErrorReporter::kArityMismatch, name);
        return nullptr;
    }
    SPDLOG_TRACE("Inliner inlining call to '{}' with {} arguments", name, arguments.size());

    ir::IRList instructions;

    // Arguments are evaluated in the caller's scope into fresh names, which the parameters then refer to.
    auto calleeNames = env.names;
    for (size_t i = 0; i < arguments.size(); ++i) {
        auto value = lowerExpr(arguments[i], env, instructions);
        if (!value) { return nullptr; }
        auto argumentName = m_nameGenerator->next();
        instructions.emplace_back(std::make_unique<ir::AssignIR>(argumentName, std::move(value)));
        calleeNames = calleeNames.extend(function->parameters[i], argumentName);
    }

    // Reset the targets, so that a path through the callee that doesn't return leaves them defined.
    ReturnSlots returnSlots;
    for (const auto& target : targets) {
        instructions.emplace_back(std::make_unique<ir::AssignIR>(target, std::make_unique<ast::IntegerLiteralAST>(0)));
        returnSlots.emplace_back(target);
    }

    Environment calleeEnv{function->scope, calleeNames, std::move(returnSlots)};
    auto body = lowerStatement(function->body, calleeEnv);
    if (!body) { return nullptr; }
    instructions.emplace_back(std::move(body));

    return std::make_unique<ir::SequenceIR>(std::move(instructions));
}

std::unique_ptr<ast::ExprAST> Inliner::lowerExpr(const ast::ExprAST* expr, const Environment& env,
        ir::IRList& prelude) {
    switch (expr->exprType) {
    case ast::kBinaryOp: {
        auto binop = static_cast<const ast::BinaryOpAST*>(expr);
        switch (binop->op) {
        case ast::kAdd: {
            auto lhs = lowerExpr(binop->lhs.get(), env, prelude);
            if (!lhs) { return nullptr; }
            auto rhs = lowerExpr(binop->rhs.get(), env, prelude);
            if (!rhs) { return nullptr; }
            return std::make_unique<ast::BinaryOpAST>(std::move(lhs), ast::kAdd, std::move(rhs));
        }

        case ast::kMul:
            return lowerMultiply(binop, env, prelude);

        case ast::kDiv:
            return lowerNestedCall("/", {binop->lhs.get(), binop->rhs.get()}, env, prelude);

        case ast::kMod:
            return lowerNestedCall("%", {binop->lhs.get(), binop->rhs.get()}, env, prelude);
        }
    } break;

    case ast::kCall: {
        auto call = static_cast<const ast::CallAST*>(expr);
        std::vector<const ast::ExprAST*> arguments;
        for (const auto& arg : call->arguments) {
            arguments.emplace_back(arg.get());
        }
        return lowerNestedCall(call->name, arguments, env, prelude);
    }

    case ast::kIdentifier: {
        auto target = findName(static_cast<const ast::IdentifierAST*>(expr)->name, env);
        if (!target) { return nullptr; }
        return std::make_unique<ast::IdentifierAST>(*target);
    }

    case ast::kIntegerLiteral:
        return std::make_unique<ast::IntegerLiteralAST>(static_cast<const ast::IntegerLiteralAST*>(expr)->value);
    }

    m_errorReporter->addError(ErrorReporter::kInternalError, "unknown expression type");
    return nullptr;
}

std::unique_ptr<ast::ExprAST> Inliner::lowerMultiply(const ast::BinaryOpAST* binop, const Environment& env,
        ir::IRList& prelude) {
    const ast::ExprAST* operand = nullptr;
    int64_t factor = 0;
    if (binop->lhs->exprType == ast::kIntegerLiteral) {
        factor = static_cast<const ast::IntegerLiteralAST*>(binop->lhs.get())->value;
        operand = binop->rhs.get();
    } else if (binop->rhs->exprType == ast::kIntegerLiteral) {
        factor = static_cast<const ast::IntegerLiteralAST*>(binop->rhs.get())->value;
        operand = binop->lhs.get();
    }

    // Negative factors have no expansion into additions, and large ones would bloat the program.
    if (!operand || factor < 0 || factor > m_maxMultiplyUnroll) {
        return lowerNestedCall("*", {binop->lhs.get(), binop->rhs.get()}, env, prelude);
    }

    if (factor <= 1) {
        auto term = lowerExpr(operand, env, prelude);
        if (!term || factor == 1) { return term; }
        return std::make_unique<ast::IntegerLiteralAST>(0);
    }

    // The operand is repeated before lowering, so any calls inside it are inlined once per term.
    std::unique_ptr<ast::ExprAST> sum = ast::clone(operand);
    for (int64_t i = 1; i < factor; ++i) {
        sum = std::make_unique<ast::BinaryOpAST>(ast::clone(operand), ast::kAdd, std::move(sum));
    }
    return lowerExpr(sum.get(), env, prelude);
}

std::unique_ptr<ast::ExprAST> Inliner::lowerNestedCall(const std::string& name,
        const std::vector<const ast::ExprAST*>& arguments, const Environment& env, ir::IRList& prelude) {
    auto result = m_nameGenerator->next();
    auto call = lowerCall(name, arguments, {result}, env);
    if (!call) { return nullptr; }
    prelude.emplace_back(std::move(call));
    return std::make_unique<ast::IdentifierAST>(result);
}

std::unique_ptr<ast::BoolAST> Inliner::lowerBool(const ast::BoolAST* cond, const Environment& env,
        ir::IRList& prelude) {
    switch (cond->boolType) {
    case ast::kCompare: {
        auto compare = static_cast<const ast::CompareAST*>(cond);
        auto lhs = lowerExpr(compare->lhs.get(), env, prelude);
        if (!lhs) { return nullptr; }
        auto rhs = lowerExpr(compare->rhs.get(), env, prelude);
        if (!rhs) { return nullptr; }

        auto greater = m_nameGenerator->next();
        auto less = m_nameGenerator->next();
        prelude.emplace_back(std::make_unique<ir::AssignIR>(greater, std::move(lhs)));
        prelude.emplace_back(std::make_unique<ir::AssignIR>(less, std::move(rhs)));
        prelude.emplace_back(std::make_unique<ir::CompareIR>(greater, less));

        // Flag |greater| is set when lhs > rhs, flag |less| when lhs < rhs, and neither when they are equal.
        switch (compare->relOp) {
        case ast::kEq:
            return std::make_unique<ast::AndAST>(notFlag(greater), notFlag(less));
        case ast::kNeq:
            return std::make_unique<ast::OrAST>(flag(greater), flag(less));
        case ast::kLt:
            return flag(less);
        case ast::kLte:
            return notFlag(greater);
        case ast::kGt:
            return flag(greater);
        case ast::kGte:
            return notFlag(less);
        }
    } break;

    case ast::kAnd: {
        auto andAST = static_cast<const ast::AndAST*>(cond);
        auto lhs = lowerBool(andAST->lhs.get(), env, prelude);
        if (!lhs) { return nullptr; }
        auto rhs = lowerBool(andAST->rhs.get(), env, prelude);
        if (!rhs) { return nullptr; }
        return std::make_unique<ast::AndAST>(std::move(lhs), std::move(rhs));
    }

    case ast::kOr: {
        auto orAST = static_cast<const ast::OrAST*>(cond);
        auto lhs = lowerBool(orAST->lhs.get(), env, prelude);
        if (!lhs) { return nullptr; }
        auto rhs = lowerBool(orAST->rhs.get(), env, prelude);
        if (!rhs) { return nullptr; }
        return std::make_unique<ast::OrAST>(std::move(lhs), std::move(rhs));
    }

    case ast::kNot: {
        auto operand = lowerBool(static_cast<const ast::NotAST*>(cond)->operand.get(), env, prelude);
        if (!operand) { return nullptr; }
        return std::make_unique<ast::NotAST>(std::move(operand));
    }

    case ast::kFlag:
        m_errorReporter->addError(ErrorReporter::kInternalError, fmt::format("flag '{}' in source program",
                static_cast<const ast::FlagAST*>(cond)->name));
        return nullptr;
    }

    m_errorReporter->addError(ErrorReporter::kInternalError, "unknown boolean expression type");
    return nullptr;
}

const std::string* Inliner::findName(const std::string& name, const Environment& env) {
    auto target = env.names.find(name);
    if (!target) {
        m_errorReporter->addError(ErrorReporter::kUndefinedVariable, name);
    }
    return target;
}

} // namespace strata
