#ifndef SRC_STRATA_DUMP_HPP_
#define SRC_STRATA_DUMP_HPP_

#include "strata/ast/AST.hpp"
#include "strata/ir/IR.hpp"

#include <string>

namespace strata {

// Human-readable renderings for logging and tests. Flags print as "@name". IR prints one instruction per line with
// two spaces of indentation per nesting level, and liveness tags, if requested and present, as a trailing
// "# {a, b}" comment. A SequenceIR in block position prints its instructions directly, elsewhere as "seq { ... }".
std::string dumpExpr(const ast::ExprAST* expr);
std::string dumpBool(const ast::BoolAST* cond);
std::string dumpSource(const ast::StmtAST* stmt);
std::string dumpIR(const ir::IR* ir, bool withLiveness = true);

} // namespace strata

#endif // SRC_STRATA_DUMP_HPP_
