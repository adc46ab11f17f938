#include "strata/Pipeline.hpp"

#include "strata/Dump.hpp"
#include "strata/ErrorReporter.hpp"
#include "strata/Flattener.hpp"
#include "strata/Inliner.hpp"
#include "strata/LivenessAnalyzer.hpp"
#include "strata/NameGenerator.hpp"
#include "strata/Normalizer.hpp"
#include "strata/Validator.hpp"

#include "spdlog/spdlog.h"

namespace strata {

Pipeline::Pipeline(): m_errorReporter(std::make_shared<ErrorReporter>()) { setDefaults(); }

Pipeline::Pipeline(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) { setDefaults(); }

Pipeline::~Pipeline() {}

void Pipeline::defineBuiltin(const std::string& name, std::vector<std::string> parameters,
        std::unique_ptr<ast::StmtAST> body) {
    m_builtinBodies.emplace_back(Normalizer::precompile(std::move(body)));
    m_builtins = m_builtins.extend(name, Function(std::move(parameters), m_builtinBodies.back().get(), m_builtins));
    SPDLOG_DEBUG("Pipeline defined builtin '{}'", name);
}

std::unique_ptr<ir::IR> Pipeline::compile(std::unique_ptr<ast::StmtAST> program) {
    NameGenerator nameGenerator;
    return compile(std::move(program), &nameGenerator);
}

std::unique_ptr<ir::IR> Pipeline::compile(std::unique_ptr<ast::StmtAST> program, NameGenerator* nameGenerator) {
    auto precompiled = Normalizer::precompile(std::move(program));
    SPDLOG_DEBUG("Precompiled source:\n{}", dumpSource(precompiled.get()));
#if STRATA_PIPELINE_VALIDATE
    if (!Validator::validatePrecompiled(precompiled.get(), nameGenerator->prefix())) {
        m_errorReporter->addError(ErrorReporter::kInternalError, "precompiled source failed validation");
        return nullptr;
    }
    if (!afterNormalizer(precompiled.get())) { return nullptr; }
#endif // STRATA_PIPELINE_VALIDATE

    Inliner inliner(m_errorReporter, nameGenerator);
    inliner.setMaxMultiplyUnroll(m_maxMultiplyUnroll);
    auto lowered = inliner.inlineProgram(precompiled.get(), m_builtins);
    if (!lowered) { return nullptr; }
    SPDLOG_DEBUG("Inlined IR:\n{}", dumpIR(lowered.get(), false));
#if STRATA_PIPELINE_VALIDATE
    if (!Validator::validateInlined(lowered.get())) {
        m_errorReporter->addError(ErrorReporter::kInternalError, "inlined IR failed validation");
        return nullptr;
    }
    if (!afterInliner(lowered.get())) { return nullptr; }
#endif // STRATA_PIPELINE_VALIDATE

    Flattener flattener;
    auto flat = flattener.flatten(std::move(lowered));
#if STRATA_PIPELINE_VALIDATE
    if (!Validator::validateFlattened(flat.get())) {
        m_errorReporter->addError(ErrorReporter::kInternalError, "flattened IR failed validation");
        return nullptr;
    }
    if (!afterFlattener(flat.get())) { return nullptr; }
#endif // STRATA_PIPELINE_VALIDATE

    LivenessAnalyzer analyzer;
    auto tagged = analyzer.analyze(std::move(flat), m_liveOut);
    SPDLOG_DEBUG("Tagged IR:\n{}", dumpIR(tagged.get()));
#if STRATA_PIPELINE_VALIDATE
    if (!Validator::validateLiveness(tagged.get())) {
        m_errorReporter->addError(ErrorReporter::kInternalError, "tagged IR failed validation");
        return nullptr;
    }
    if (!afterLivenessAnalyzer(tagged.get())) { return nullptr; }
#endif // STRATA_PIPELINE_VALIDATE

    return tagged;
}

#if STRATA_PIPELINE_VALIDATE
bool Pipeline::afterNormalizer(const ast::StmtAST*) { return true; }
bool Pipeline::afterInliner(const ir::IR*) { return true; }
bool Pipeline::afterFlattener(const ir::IR*) { return true; }
bool Pipeline::afterLivenessAnalyzer(const ir::IR*) { return true; }
#endif // STRATA_PIPELINE_VALIDATE

void Pipeline::setDefaults() {
    m_maxMultiplyUnroll = Inliner::kDefaultMaxMultiplyUnroll;
}

} // namespace strata
