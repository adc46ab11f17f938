#ifndef SRC_STRATA_PIPELINE_HPP_
#define SRC_STRATA_PIPELINE_HPP_

// By default we turn off pipeline validation in Release builds.
#ifndef STRATA_PIPELINE_VALIDATE
#ifdef NDEBUG
#define STRATA_PIPELINE_VALIDATE 0
#else
#define STRATA_PIPELINE_VALIDATE 1
#endif // NDEBUG
#endif // STRATA_PIPELINE_VALIDATE

#include "strata/ast/AST.hpp"
#include "strata/FunctionTable.hpp"
#include "strata/ir/IR.hpp"

#include <list>
#include <memory>
#include <string>
#include <vector>

namespace strata {

class ErrorReporter;
class NameGenerator;

// Utility class to compile a source tree into liveness-tagged IR. Includes optional code to validate the compiler
// state between each step in the pipeline, and virtual methods for additional validation work per-step.
class Pipeline {
public:
    Pipeline();
    explicit Pipeline(std::shared_ptr<ErrorReporter> errorReporter);
    virtual ~Pipeline();

    // Parameters to override before compilation, or leave at defaults.
    int64_t maxMultiplyUnroll() const { return m_maxMultiplyUnroll; }
    void setMaxMultiplyUnroll(int64_t n) { m_maxMultiplyUnroll = n; }

    const ir::LiveSet& liveOut() const { return m_liveOut; }
    void setLiveOut(ir::LiveSet liveOut) { m_liveOut = std::move(liveOut); }

    const FunctionTable& builtins() const { return m_builtins; }
    void setBuiltins(FunctionTable builtins) { m_builtins = std::move(builtins); }

    // Precompiles |body| and adds it to the builtins as |name|. The Pipeline keeps the body alive. Builtins may call
    // builtins defined before them.
    void defineBuiltin(const std::string& name, std::vector<std::string> parameters,
            std::unique_ptr<ast::StmtAST> body);

    // Returns nullptr on error, with the reason in the ErrorReporter. Without a |nameGenerator| the Pipeline uses a
    // fresh one for each program.
    std::unique_ptr<ir::IR> compile(std::unique_ptr<ast::StmtAST> program);
    std::unique_ptr<ir::IR> compile(std::unique_ptr<ast::StmtAST> program, NameGenerator* nameGenerator);

    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

#if STRATA_PIPELINE_VALIDATE
    // With pipeline validation on these methods are called after internal validation of each step. Their default
    // implementions do nothing. They are intended primarily for use by the Pipeline unittests, allowing for additional
    // testing work on each pipeline step as needed. Any method that returns false will stop the pipeline from moving
    // to the next step.
    virtual bool afterNormalizer(const ast::StmtAST* program);
    virtual bool afterInliner(const ir::IR* ir);
    virtual bool afterFlattener(const ir::IR* ir);
    virtual bool afterLivenessAnalyzer(const ir::IR* ir);
#endif // STRATA_PIPELINE_VALIDATE

protected:
    void setDefaults();

    std::shared_ptr<ErrorReporter> m_errorReporter;
    int64_t m_maxMultiplyUnroll;
    ir::LiveSet m_liveOut;
    FunctionTable m_builtins;
    std::list<std::unique_ptr<ast::StmtAST>> m_builtinBodies;
};

} // namespace strata

#endif // SRC_STRATA_PIPELINE_HPP_
