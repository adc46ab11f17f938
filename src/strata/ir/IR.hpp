#ifndef SRC_STRATA_IR_IR_HPP_
#define SRC_STRATA_IR_IR_HPP_

#include "strata/ast/AST.hpp"

#include <cassert>
#include <list>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace strata {
namespace ir {

// Names whose current value may still be read by some instruction reachable afterward. Ordered so that dumps and
// comparisons are deterministic.
using LiveSet = std::set<std::string>;

enum Opcode {
    kAssign,
    kCompare,
    kConditional,
    kLoop,
    kParallel,
    kSequence
};

// Target instructions. Expressions are ast::ExprAST trees restricted to identifiers, literals and additions, and
// guards are ast::BoolAST trees restricted to flags and the logical connectives. Every instruction other than
// Sequence and Parallel carries a liveness tag once the LivenessAnalyzer has run.
struct IR {
    IR() = delete;
    virtual ~IR() = default;

    Opcode opcode;

    bool isTagged() const { return m_liveness.has_value(); }
    const LiveSet& liveness() const {
        assert(m_liveness);
        return *m_liveness;
    }
    // Tags are assigned exactly once.
    void setLiveness(LiveSet live) {
        assert(!m_liveness);
        assert(opcode != kSequence && opcode != kParallel);
        m_liveness = std::move(live);
    }

protected:
    explicit IR(Opcode op): opcode(op) {}

private:
    std::optional<LiveSet> m_liveness;
};

using IRList = std::list<std::unique_ptr<IR>>;

struct AssignIR : public IR {
    AssignIR(std::string n, std::unique_ptr<ast::ExprAST> v): IR(kAssign), name(std::move(n)), value(std::move(v)) {}
    virtual ~AssignIR() = default;

    std::string name;
    std::unique_ptr<ast::ExprAST> value;
};

// Reads the numeric cells |lhs| and |rhs| and sets two flags named after them: flag |lhs| is true if the first value
// is greater, flag |rhs| if it is less. Neither is set when the values are equal. Cells and flags are separate
// namespaces that share keys.
struct CompareIR : public IR {
    CompareIR(std::string l, std::string r): IR(kCompare), lhs(std::move(l)), rhs(std::move(r)) {}
    virtual ~CompareIR() = default;

    std::string lhs;
    std::string rhs;
};

struct ConditionalIR : public IR {
    ConditionalIR(std::unique_ptr<ast::BoolAST> cond, std::unique_ptr<IR> t, std::unique_ptr<IR> e):
        IR(kConditional), condition(std::move(cond)), thenBlock(std::move(t)), elseBlock(std::move(e)) {}
    virtual ~ConditionalIR() = default;

    std::unique_ptr<ast::BoolAST> condition;
    std::unique_ptr<IR> thenBlock;
    std::unique_ptr<IR> elseBlock;
};

struct LoopIR : public IR {
    LoopIR(std::unique_ptr<ast::BoolAST> cond, std::unique_ptr<IR> b):
        IR(kLoop), condition(std::move(cond)), body(std::move(b)) {}
    virtual ~LoopIR() = default;

    std::unique_ptr<ast::BoolAST> condition;
    std::unique_ptr<IR> body;
};

// Branches that a downstream executor may run in any order or concurrently.
struct ParallelIR : public IR {
    ParallelIR(): IR(kParallel) {}
    explicit ParallelIR(IRList b): IR(kParallel), branches(std::move(b)) {}
    virtual ~ParallelIR() = default;

    IRList branches;
};

struct SequenceIR : public IR {
    SequenceIR(): IR(kSequence) {}
    explicit SequenceIR(IRList i): IR(kSequence), instructions(std::move(i)) {}
    virtual ~SequenceIR() = default;

    IRList instructions;
};

// Deep copy, including any liveness tags.
std::unique_ptr<IR> clone(const IR* ir);
IRList clone(const IRList& instructions);

// Adds the identifiers read by |expr|, or the flags read by |cond|, to |names|.
void collectReads(const ast::ExprAST* expr, LiveSet& names);
void collectReads(const ast::BoolAST* cond, LiveSet& names);

} // namespace ir
} // namespace strata

#endif // SRC_STRATA_IR_IR_HPP_
