#ifndef SRC_STRATA_FUNCTION_TABLE_HPP_
#define SRC_STRATA_FUNCTION_TABLE_HPP_

#include "strata/ScopedTable.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

namespace ast {
struct StmtAST;
} // namespace ast

struct Function;

// Function name to definition.
using FunctionTable = ScopedTable<Function>;
// Source variable name to target variable name.
using RenameTable = ScopedTable<std::string>;
// Target name receiving each returned value of the active call site, or nothing if the caller discards it.
using ReturnSlots = std::vector<std::optional<std::string>>;

struct Function {
    Function() = delete;
    Function(std::vector<std::string> params, const ast::StmtAST* b, FunctionTable s):
        parameters(std::move(params)), body(b), scope(std::move(s)) {}

    std::vector<std::string> parameters;
    // Not owned, the body must outlive any lowering run that uses this Function.
    const ast::StmtAST* body;
    // The functions visible at the point of definition, which excludes the function itself.
    FunctionTable scope;
};

} // namespace strata

#endif // SRC_STRATA_FUNCTION_TABLE_HPP_
