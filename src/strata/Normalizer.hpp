#ifndef SRC_STRATA_NORMALIZER_HPP_
#define SRC_STRATA_NORMALIZER_HPP_

#include "strata/ast/AST.hpp"

#include <memory>

namespace strata {

// Canonicalizes a source tree before inlining. Code following a conditional moves into both of its branches, and code
// that can only run after a return is deleted, so that every Return ends the path it is on. All methods consume
// their input tree and return the rewritten one.
class Normalizer {
public:
    Normalizer() = delete;

    // The entry point, equivalent to removeDeadBranches(absorbBranches(leftify(stmt))). Idempotent.
    static std::unique_ptr<ast::StmtAST> precompile(std::unique_ptr<ast::StmtAST> stmt);

    // Rotates Sequence(Sequence(a, b), c) into Sequence(a, Sequence(b, c)) throughout the tree, leaving every
    // Sequence spine leaning right.
    static std::unique_ptr<ast::StmtAST> leftify(std::unique_ptr<ast::StmtAST> stmt);

    // Rewrites Sequence(Conditional(cond, s1, s2), tail) as Conditional(cond, s1; tail, s2; tail). The tail is
    // copied into both branches even if one of them returns. Sequences with a Nop on either side collapse first.
    static std::unique_ptr<ast::StmtAST> absorbBranches(std::unique_ptr<ast::StmtAST> stmt);

    // True if a Return is structurally reachable within |stmt|.
    static bool returns(const ast::StmtAST* stmt);

    // Drops the second half of any Sequence whose first half returns.
    static std::unique_ptr<ast::StmtAST> removeDeadBranches(std::unique_ptr<ast::StmtAST> stmt);
};

} // namespace strata

#endif // SRC_STRATA_NORMALIZER_HPP_
