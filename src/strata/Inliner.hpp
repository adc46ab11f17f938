#ifndef SRC_STRATA_INLINER_HPP_
#define SRC_STRATA_INLINER_HPP_

#include "strata/ast/AST.hpp"
#include "strata/FunctionTable.hpp"
#include "strata/ir/IR.hpp"

#include <memory>
#include <string>
#include <vector>

namespace strata {

class ErrorReporter;
class NameGenerator;

// Lowers a precompiled source tree into untagged IR. Every call is inlined at its call site, variables are renamed so
// that inlined bodies and shadowing bindings never capture each other's names, multiplication, division and modulo
// become additions or calls to the builtins "*", "/" and "%", and comparisons become CompareIR instructions guarded
// by flag formulas.
class Inliner {
public:
    static constexpr int64_t kDefaultMaxMultiplyUnroll = 64;

    Inliner() = delete;
    Inliner(std::shared_ptr<ErrorReporter> errorReporter, NameGenerator* nameGenerator);
    ~Inliner() = default;

    // Multiplications by a literal at most this large are unrolled into additions, larger ones call "*".
    int64_t maxMultiplyUnroll() const { return m_maxMultiplyUnroll; }
    void setMaxMultiplyUnroll(int64_t n) { m_maxMultiplyUnroll = n; }

    // Lowers |program|, which should have been through Normalizer::precompile(), with |builtins| as the initial
    // function table. Returns nullptr on error, with the reason in the ErrorReporter.
    std::unique_ptr<ir::IR> inlineProgram(const ast::StmtAST* program, const FunctionTable& builtins);

private:
    struct Environment {
        FunctionTable functions;
        RenameTable names;
        ReturnSlots returnSlots;
    };

    std::unique_ptr<ir::IR> lowerStatement(const ast::StmtAST* stmt, const Environment& env);

    // Inlines the function |name| applied to |arguments|, with returned values stored in the already renamed
    // |targets|.
    std::unique_ptr<ir::IR> lowerCall(const std::string& name, const std::vector<const ast::ExprAST*>& arguments,
            const std::vector<std::string>& targets, const Environment& env);

    // Expression lowering appends any instructions needed before the returned expression can be evaluated to
    // |prelude|.
    std::unique_ptr<ast::ExprAST> lowerExpr(const ast::ExprAST* expr, const Environment& env, ir::IRList& prelude);
    std::unique_ptr<ast::ExprAST> lowerMultiply(const ast::BinaryOpAST* binop, const Environment& env,
            ir::IRList& prelude);
    std::unique_ptr<ast::ExprAST> lowerNestedCall(const std::string& name,
            const std::vector<const ast::ExprAST*>& arguments, const Environment& env, ir::IRList& prelude);
    std::unique_ptr<ast::BoolAST> lowerBool(const ast::BoolAST* cond, const Environment& env, ir::IRList& prelude);

    // Returns nullptr and reports an error if |name| is not bound.
    const std::string* findName(const std::string& name, const Environment& env);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    NameGenerator* m_nameGenerator;
    int64_t m_maxMultiplyUnroll;
};

} // namespace strata

#endif // SRC_STRATA_INLINER_HPP_
