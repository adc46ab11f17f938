#ifndef SRC_STRATA_LIVENESS_ANALYZER_HPP_
#define SRC_STRATA_LIVENESS_ANALYZER_HPP_

#include "strata/ir/IR.hpp"

#include <memory>

namespace strata {

// Backward dataflow over flattened IR. Computes the set of names live after each instruction, deletes assignments to
// names that are never read afterward, and tags every surviving instruction with its live-after set. Loops are
// iterated to a fixpoint before their bodies are tagged.
class LivenessAnalyzer {
public:
    LivenessAnalyzer() = default;
    ~LivenessAnalyzer() = default;

    // Consumes |block| and returns it tagged, with dead assignments removed. |liveOut| is the set of names the
    // program's consumer reads after the block finishes. If the whole block is dead this returns an empty SequenceIR.
    std::unique_ptr<ir::IR> analyze(std::unique_ptr<ir::IR> block, const ir::LiveSet& liveOut = ir::LiveSet());

    // The names live before |instruction| given the names live after it. Does not modify the instruction.
    static ir::LiveSet liveBefore(const ir::IR* instruction, const ir::LiveSet& liveAfter);

    // The set a loop is tagged with: the least set containing the guard's reads and |liveAfter| that is stable under
    // one more pass through the body.
    static ir::LiveSet loopFixpoint(const ir::LoopIR* loop, const ir::LiveSet& liveAfter);

private:
    // Returns nullptr if |instruction| is a dead assignment. Sets |liveBeforeOut| to the names live before it.
    std::unique_ptr<ir::IR> annotate(std::unique_ptr<ir::IR> instruction, const ir::LiveSet& liveAfter,
            ir::LiveSet& liveBeforeOut);
    // Tags |instruction| unless a previous analysis already did.
    void tag(ir::IR* instruction, const ir::LiveSet& live);
};

} // namespace strata

#endif // SRC_STRATA_LIVENESS_ANALYZER_HPP_
