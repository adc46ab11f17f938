#ifndef SRC_STRATA_AST_BUILDERS_HPP_
#define SRC_STRATA_AST_BUILDERS_HPP_

#include "strata/ast/AST.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace strata {
namespace ast {

// Shorthand constructors for writing source trees by hand, mostly in tests and drivers.

template <typename T>
void appendAll(std::vector<std::unique_ptr<T>>&) {}

template <typename T, typename First, typename... Rest>
void appendAll(std::vector<std::unique_ptr<T>>& list, First&& first, Rest&&... rest) {
    list.emplace_back(std::forward<First>(first));
    appendAll(list, std::forward<Rest>(rest)...);
}

inline std::unique_ptr<ExprAST> ident(std::string name) { return std::make_unique<IdentifierAST>(std::move(name)); }
inline std::unique_ptr<ExprAST> literal(int64_t value) { return std::make_unique<IntegerLiteralAST>(value); }

inline std::unique_ptr<ExprAST> add(std::unique_ptr<ExprAST> lhs, std::unique_ptr<ExprAST> rhs) {
    return std::make_unique<BinaryOpAST>(std::move(lhs), kAdd, std::move(rhs));
}
inline std::unique_ptr<ExprAST> mul(std::unique_ptr<ExprAST> lhs, std::unique_ptr<ExprAST> rhs) {
    return std::make_unique<BinaryOpAST>(std::move(lhs), kMul, std::move(rhs));
}
inline std::unique_ptr<ExprAST> div(std::unique_ptr<ExprAST> lhs, std::unique_ptr<ExprAST> rhs) {
    return std::make_unique<BinaryOpAST>(std::move(lhs), kDiv, std::move(rhs));
}
inline std::unique_ptr<ExprAST> mod(std::unique_ptr<ExprAST> lhs, std::unique_ptr<ExprAST> rhs) {
    return std::make_unique<BinaryOpAST>(std::move(lhs), kMod, std::move(rhs));
}

template <typename... Args>
std::unique_ptr<ExprAST> call(std::string name, Args&&... args) {
    std::vector<std::unique_ptr<ExprAST>> arguments;
    appendAll(arguments, std::forward<Args>(args)...);
    return std::make_unique<CallAST>(std::move(name), std::move(arguments));
}

inline std::unique_ptr<BoolAST> compare(std::unique_ptr<ExprAST> lhs, RelOp relOp, std::unique_ptr<ExprAST> rhs) {
    return std::make_unique<CompareAST>(std::move(lhs), relOp, std::move(rhs));
}
inline std::unique_ptr<BoolAST> both(std::unique_ptr<BoolAST> lhs, std::unique_ptr<BoolAST> rhs) {
    return std::make_unique<AndAST>(std::move(lhs), std::move(rhs));
}
inline std::unique_ptr<BoolAST> either(std::unique_ptr<BoolAST> lhs, std::unique_ptr<BoolAST> rhs) {
    return std::make_unique<OrAST>(std::move(lhs), std::move(rhs));
}
inline std::unique_ptr<BoolAST> negate(std::unique_ptr<BoolAST> operand) {
    return std::make_unique<NotAST>(std::move(operand));
}

inline std::unique_ptr<StmtAST> nop() { return std::make_unique<NopAST>(); }

inline std::unique_ptr<StmtAST> multiAssign(std::vector<std::string> names, std::unique_ptr<ExprAST> value) {
    return std::make_unique<MultiAssignAST>(std::move(names), std::move(value));
}
inline std::unique_ptr<StmtAST> assign(std::string name, std::unique_ptr<ExprAST> value) {
    return multiAssign(std::vector<std::string>{std::move(name)}, std::move(value));
}

template <typename... Args>
std::unique_ptr<StmtAST> ret(Args&&... args) {
    std::vector<std::unique_ptr<ExprAST>> values;
    appendAll(values, std::forward<Args>(args)...);
    return std::make_unique<ReturnAST>(std::move(values));
}

inline std::unique_ptr<StmtAST> var(std::string name, std::unique_ptr<ExprAST> value, std::unique_ptr<StmtAST> rest) {
    return std::make_unique<ScopedBindingAST>(std::move(name), std::move(value), std::move(rest));
}

inline std::unique_ptr<StmtAST> def(std::string name, std::vector<std::string> parameters,
        std::unique_ptr<StmtAST> body, std::unique_ptr<StmtAST> rest) {
    return std::make_unique<FunctionDefAST>(std::move(name), std::move(parameters), std::move(body), std::move(rest));
}

inline std::unique_ptr<StmtAST> ifElse(std::unique_ptr<BoolAST> condition, std::unique_ptr<StmtAST> thenBlock,
        std::unique_ptr<StmtAST> elseBlock) {
    return std::make_unique<ConditionalAST>(std::move(condition), std::move(thenBlock), std::move(elseBlock));
}

inline std::unique_ptr<StmtAST> loop(std::unique_ptr<BoolAST> condition, std::unique_ptr<StmtAST> body) {
    return std::make_unique<LoopAST>(std::move(condition), std::move(body));
}

inline std::unique_ptr<StmtAST> seq(std::unique_ptr<StmtAST> first, std::unique_ptr<StmtAST> second) {
    return std::make_unique<SequenceAST>(std::move(first), std::move(second));
}

// Chains three or more statements into a right-leaning spine.
template <typename... Rest>
std::unique_ptr<StmtAST> seq(std::unique_ptr<StmtAST> first, std::unique_ptr<StmtAST> second,
        std::unique_ptr<StmtAST> third, Rest&&... rest) {
    return seq(std::move(first), seq(std::move(second), std::move(third), std::forward<Rest>(rest)...));
}

} // namespace ast
} // namespace strata

#endif // SRC_STRATA_AST_BUILDERS_HPP_
