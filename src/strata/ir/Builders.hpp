#ifndef SRC_STRATA_IR_BUILDERS_HPP_
#define SRC_STRATA_IR_BUILDERS_HPP_

#include "strata/ast/Builders.hpp"
#include "strata/ir/IR.hpp"

#include <memory>
#include <string>
#include <utility>

namespace strata {
namespace ir {

// Shorthand constructors for writing target trees by hand.

inline void appendAll(IRList&) {}

template <typename First, typename... Rest>
void appendAll(IRList& list, First&& first, Rest&&... rest) {
    list.emplace_back(std::forward<First>(first));
    appendAll(list, std::forward<Rest>(rest)...);
}

inline std::unique_ptr<IR> assign(std::string name, std::unique_ptr<ast::ExprAST> value) {
    return std::make_unique<AssignIR>(std::move(name), std::move(value));
}

inline std::unique_ptr<IR> compare(std::string lhs, std::string rhs) {
    return std::make_unique<CompareIR>(std::move(lhs), std::move(rhs));
}

inline std::unique_ptr<ast::BoolAST> flag(std::string name) { return std::make_unique<ast::FlagAST>(std::move(name)); }

inline std::unique_ptr<IR> ifElse(std::unique_ptr<ast::BoolAST> condition, std::unique_ptr<IR> thenBlock,
        std::unique_ptr<IR> elseBlock) {
    return std::make_unique<ConditionalIR>(std::move(condition), std::move(thenBlock), std::move(elseBlock));
}

inline std::unique_ptr<IR> loop(std::unique_ptr<ast::BoolAST> condition, std::unique_ptr<IR> body) {
    return std::make_unique<LoopIR>(std::move(condition), std::move(body));
}

template <typename... Args>
std::unique_ptr<IR> par(Args&&... args) {
    IRList branches;
    appendAll(branches, std::forward<Args>(args)...);
    return std::make_unique<ParallelIR>(std::move(branches));
}

template <typename... Args>
std::unique_ptr<IR> seq(Args&&... args) {
    IRList instructions;
    appendAll(instructions, std::forward<Args>(args)...);
    return std::make_unique<SequenceIR>(std::move(instructions));
}

} // namespace ir
} // namespace strata

#endif // SRC_STRATA_IR_BUILDERS_HPP_
