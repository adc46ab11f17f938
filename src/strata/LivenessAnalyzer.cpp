#include "strata/LivenessAnalyzer.hpp"

#include "spdlog/spdlog.h"

namespace strata {

/*
Dataflow equations, with in(i) the set live before instruction i and out(i) the set live after it:

    Assign(n, e)        dead if n not in out, then in = out
                        otherwise in = (out - {n}) + reads(e)
    Compare(a, b)       never removed, in = out
    If(c, t, f)         in = reads(c) + in(t) + in(f), both branches see the same out
    While(c, body)      v0 = reads(c) + out
                        v(k+1) = v0 + in(body) where out(body) = v(k), until v(k+1) = v(k)
                        in = v(k), and the body is tagged against v(k)
    Seq(i1 ... in)      out(ik) = in(ik+1), out(in) = out
    Par(b1 ... bn)      every branch sees the same out, in = in(b1) + ... + in(bn)

Every instruction but Seq and Par is tagged with its out set.
*/

std::unique_ptr<ir::IR> LivenessAnalyzer::analyze(std::unique_ptr<ir::IR> block, const ir::LiveSet& liveOut) {
    ir::LiveSet liveIn;
    auto tagged = annotate(std::move(block), liveOut, liveIn);
    if (!tagged) {
        SPDLOG_DEBUG("LivenessAnalyzer removed the entire block");
        return std::make_unique<ir::SequenceIR>();
    }
    SPDLOG_DEBUG("LivenessAnalyzer finished with {} names live on entry", liveIn.size());
    return tagged;
}

// static
ir::LiveSet LivenessAnalyzer::liveBefore(const ir::IR* instruction, const ir::LiveSet& liveAfter) {
    switch (instruction->opcode) {
    case ir::kAssign: {
        auto assign = static_cast<const ir::AssignIR*>(instruction);
        if (liveAfter.count(assign->name) == 0) { return liveAfter; }
        ir::LiveSet live = liveAfter;
        live.erase(assign->name);
        ir::collectReads(assign->value.get(), live);
        return live;
    }

    case ir::kCompare:
        return liveAfter;

    case ir::kConditional: {
        auto conditional = static_cast<const ir::ConditionalIR*>(instruction);
        auto live = liveBefore(conditional->thenBlock.get(), liveAfter);
        auto elseLive = liveBefore(conditional->elseBlock.get(), liveAfter);
        live.insert(elseLive.begin(), elseLive.end());
        ir::collectReads(conditional->condition.get(), live);
        return live;
    }

    case ir::kLoop:
        return loopFixpoint(static_cast<const ir::LoopIR*>(instruction), liveAfter);

    case ir::kParallel: {
        auto parallel = static_cast<const ir::ParallelIR*>(instruction);
        ir::LiveSet live;
        for (const auto& branch : parallel->branches) {
            auto branchLive = liveBefore(branch.get(), liveAfter);
            live.insert(branchLive.begin(), branchLive.end());
        }
        return live;
    }

    case ir::kSequence: {
        auto sequence = static_cast<const ir::SequenceIR*>(instruction);
        ir::LiveSet live = liveAfter;
        for (auto iter = sequence->instructions.rbegin(); iter != sequence->instructions.rend(); ++iter) {
            live = liveBefore(iter->get(), live);
        }
        return live;
    }
    }

    return liveAfter;
}

// static
ir::LiveSet LivenessAnalyzer::loopFixpoint(const ir::LoopIR* loop, const ir::LiveSet& liveAfter) {
    ir::LiveSet entry = liveAfter;
    ir::collectReads(loop->condition.get(), entry);

    // Each pass can only add names and the names are finite, so this terminates.
    ir::LiveSet live = entry;
    while (true) {
        ir::LiveSet next = entry;
        auto bodyLive = liveBefore(loop->body.get(), live);
        next.insert(bodyLive.begin(), bodyLive.end());
        if (next == live) { break; }
        live.swap(next);
    }
    return live;
}

std::unique_ptr<ir::IR> LivenessAnalyzer::annotate(std::unique_ptr<ir::IR> instruction, const ir::LiveSet& liveAfter,
        ir::LiveSet& liveBeforeOut) {
    switch (instruction->opcode) {
    case ir::kAssign: {
        auto assign = static_cast<ir::AssignIR*>(instruction.get());
        if (liveAfter.count(assign->name) == 0) {
            SPDLOG_TRACE("LivenessAnalyzer removing dead store to '{}'", assign->name);
            liveBeforeOut = liveAfter;
            return nullptr;
        }
        tag(instruction.get(), liveAfter);
        liveBeforeOut = liveBefore(instruction.get(), liveAfter);
    } break;

    case ir::kCompare:
        tag(instruction.get(), liveAfter);
        liveBeforeOut = liveBefore(instruction.get(), liveAfter);
        break;

    case ir::kConditional: {
        auto conditional = static_cast<ir::ConditionalIR*>(instruction.get());
        ir::LiveSet thenLive;
        conditional->thenBlock = annotate(std::move(conditional->thenBlock), liveAfter, thenLive);
        if (!conditional->thenBlock) { conditional->thenBlock = std::make_unique<ir::SequenceIR>(); }
        ir::LiveSet elseLive;
        conditional->elseBlock = annotate(std::move(conditional->elseBlock), liveAfter, elseLive);
        if (!conditional->elseBlock) { conditional->elseBlock = std::make_unique<ir::SequenceIR>(); }

        tag(instruction.get(), liveAfter);
        thenLive.insert(elseLive.begin(), elseLive.end());
        ir::collectReads(conditional->condition.get(), thenLive);
        liveBeforeOut.swap(thenLive);
    } break;

    case ir::kLoop: {
        auto loop = static_cast<ir::LoopIR*>(instruction.get());
        auto fixpoint = loopFixpoint(loop, liveAfter);
        tag(instruction.get(), fixpoint);

        ir::LiveSet bodyLive;
        loop->body = annotate(std::move(loop->body), fixpoint, bodyLive);
        if (!loop->body) { loop->body = std::make_unique<ir::SequenceIR>(); }
        liveBeforeOut.swap(fixpoint);
    } break;

    case ir::kParallel: {
        auto parallel = static_cast<ir::ParallelIR*>(instruction.get());
        ir::LiveSet live;
        for (auto& branch : parallel->branches) {
            ir::LiveSet branchLive;
            branch = annotate(std::move(branch), liveAfter, branchLive);
            if (!branch) { branch = std::make_unique<ir::SequenceIR>(); }
            live.insert(branchLive.begin(), branchLive.end());
        }
        liveBeforeOut.swap(live);
    } break;

    case ir::kSequence: {
        auto sequence = static_cast<ir::SequenceIR*>(instruction.get());
        ir::IRList kept;
        ir::LiveSet live = liveAfter;
        for (auto iter = sequence->instructions.rbegin(); iter != sequence->instructions.rend(); ++iter) {
            ir::LiveSet before;
            auto tagged = annotate(std::move(*iter), live, before);
            if (tagged) { kept.emplace_front(std::move(tagged)); }
            live.swap(before);
        }
        sequence->instructions.swap(kept);
        liveBeforeOut.swap(live);
    } break;
    }

    return instruction;
}

void LivenessAnalyzer::tag(ir::IR* instruction, const ir::LiveSet& live) {
    if (!instruction->isTagged()) {
        instruction->setLiveness(live);
    }
}

} // namespace strata
