#ifndef SRC_STRATA_FLATTENER_HPP_
#define SRC_STRATA_FLATTENER_HPP_

#include "strata/ir/IR.hpp"

#include <memory>

namespace strata {

// Splices nested SequenceIR instructions into their enclosing block, so that each block is either a single
// instruction or one SequenceIR with no SequenceIR children. Conditionals, loops and parallel branches keep their
// structure, with each of their blocks flattened independently.
class Flattener {
public:
    Flattener() = default;
    ~Flattener() = default;

    std::unique_ptr<ir::IR> flatten(std::unique_ptr<ir::IR> block);

private:
    void splice(std::unique_ptr<ir::IR> ir, ir::IRList& instructions);
};

} // namespace strata

#endif // SRC_STRATA_FLATTENER_HPP_
