#ifndef SRC_STRATA_VALIDATOR_HPP_
#define SRC_STRATA_VALIDATOR_HPP_

#include "strata/ast/AST.hpp"
#include "strata/ir/IR.hpp"

#include <string>

namespace strata {

// The validator can check the artifacts of each stage of compilation for internal consistency. Failures are logged.
class Validator {
public:
    // Every Sequence spine leans right, no Sequence starts with a Conditional or contains a Nop, and nothing follows
    // a statement that returns. If |reservedPrefix| is not empty no binding or parameter may start with it, so source
    // names can't collide with names from a NameGenerator using that prefix.
    static bool validatePrecompiled(const ast::StmtAST* stmt, const std::string& reservedPrefix = std::string());
    // No calls, multiplications, divisions or modulos in expressions, no comparisons in guards, and no tags yet.
    static bool validateInlined(const ir::IR* ir);
    // No SequenceIR directly inside another, and no single-instruction SequenceIR.
    static bool validateFlattened(const ir::IR* ir);
    // Every instruction but Sequence and Parallel is tagged, and every kept assignment targets a live name.
    static bool validateLiveness(const ir::IR* ir);

private:
    static bool validateLoweredExpr(const ast::ExprAST* expr);
    static bool validateLoweredBool(const ast::BoolAST* cond);
    static bool validateFlatBlock(const ir::IR* block);
    static bool isReserved(const std::string& name, const std::string& reservedPrefix);
};

} // namespace strata

#endif // SRC_STRATA_VALIDATOR_HPP_
