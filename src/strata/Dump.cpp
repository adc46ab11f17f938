#include "strata/Dump.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"

namespace {

const char* operatorSymbol(strata::ast::BinaryOperator op) {
    switch (op) {
    case strata::ast::kAdd:
        return "+";
    case strata::ast::kMul:
        return "*";
    case strata::ast::kDiv:
        return "/";
    case strata::ast::kMod:
        return "%";
    }
    return "?";
}

const char* relOpSymbol(strata::ast::RelOp relOp) {
    switch (relOp) {
    case strata::ast::kEq:
        return "==";
    case strata::ast::kNeq:
        return "!=";
    case strata::ast::kLt:
        return "<";
    case strata::ast::kLte:
        return "<=";
    case strata::ast::kGt:
        return ">";
    case strata::ast::kGte:
        return ">=";
    }
    return "?";
}

std::string operand(const strata::ast::ExprAST* expr) {
    if (expr->exprType == strata::ast::kBinaryOp) { return fmt::format("({})", strata::dumpExpr(expr)); }
    return strata::dumpExpr(expr);
}

std::string exprList(const std::vector<std::unique_ptr<strata::ast::ExprAST>>& exprs) {
    std::vector<std::string> parts;
    for (const auto& expr : exprs) {
        parts.emplace_back(strata::dumpExpr(expr.get()));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

class SourceDumper {
public:
    std::string dump(const strata::ast::StmtAST* stmt) {
        block(stmt, 0);
        return m_out;
    }

private:
    void line(int indent, const std::string& text) {
        m_out.append(indent * 2, ' ');
        m_out.append(text);
        m_out.push_back('\n');
    }

    void block(const strata::ast::StmtAST* stmt, int indent) {
        switch (stmt->stmtType) {
        case strata::ast::kConditional: {
            auto conditional = static_cast<const strata::ast::ConditionalAST*>(stmt);
            line(indent, fmt::format("if {} {{", strata::dumpBool(conditional->condition.get())));
            block(conditional->thenBlock.get(), indent + 1);
            line(indent, "} else {");
            block(conditional->elseBlock.get(), indent + 1);
            line(indent, "}");
        } break;

        case strata::ast::kFunctionDef: {
            auto def = static_cast<const strata::ast::FunctionDefAST*>(stmt);
            line(indent, fmt::format("def {}({}) {{", def->name, fmt::join(def->parameters, ", ")));
            block(def->body.get(), indent + 1);
            line(indent, "}");
            block(def->rest.get(), indent);
        } break;

        case strata::ast::kLoop: {
            auto loop = static_cast<const strata::ast::LoopAST*>(stmt);
            line(indent, fmt::format("while {} {{", strata::dumpBool(loop->condition.get())));
            block(loop->body.get(), indent + 1);
            line(indent, "}");
        } break;

        case strata::ast::kMultiAssign: {
            auto assign = static_cast<const strata::ast::MultiAssignAST*>(stmt);
            line(indent, fmt::format("{} := {}", fmt::join(assign->names, ", "),
                    strata::dumpExpr(assign->value.get())));
        } break;

        case strata::ast::kNop:
            line(indent, "nop");
            break;

        case strata::ast::kReturn: {
            auto returnAST = static_cast<const strata::ast::ReturnAST*>(stmt);
            if (returnAST->values.empty()) {
                line(indent, "return");
            } else {
                line(indent, fmt::format("return {}", exprList(returnAST->values)));
            }
        } break;

        case strata::ast::kScopedBinding: {
            auto binding = static_cast<const strata::ast::ScopedBindingAST*>(stmt);
            line(indent, fmt::format("var {} = {}", binding->name, strata::dumpExpr(binding->value.get())));
            block(binding->rest.get(), indent);
        } break;

        case strata::ast::kSequence: {
            auto sequence = static_cast<const strata::ast::SequenceAST*>(stmt);
            block(sequence->first.get(), indent);
            block(sequence->second.get(), indent);
        } break;
        }
    }

    std::string m_out;
};

class IRDumper {
public:
    explicit IRDumper(bool withLiveness): m_withLiveness(withLiveness) {}

    std::string dump(const strata::ir::IR* ir) {
        block(ir, 0);
        return m_out;
    }

private:
    void line(int indent, const std::string& text, const strata::ir::IR* tagged = nullptr) {
        m_out.append(indent * 2, ' ');
        m_out.append(text);
        if (m_withLiveness && tagged && tagged->isTagged()) {
            m_out.append(fmt::format("  # {{{}}}", fmt::join(tagged->liveness(), ", ")));
        }
        m_out.push_back('\n');
    }

    void block(const strata::ir::IR* ir, int indent) {
        if (ir->opcode == strata::ir::kSequence) {
            for (const auto& child : static_cast<const strata::ir::SequenceIR*>(ir)->instructions) {
                instruction(child.get(), indent);
            }
            return;
        }
        instruction(ir, indent);
    }

    void instruction(const strata::ir::IR* ir, int indent) {
        switch (ir->opcode) {
        case strata::ir::kAssign: {
            auto assign = static_cast<const strata::ir::AssignIR*>(ir);
            line(indent, fmt::format("{} := {}", assign->name, strata::dumpExpr(assign->value.get())), ir);
        } break;

        case strata::ir::kCompare: {
            auto compare = static_cast<const strata::ir::CompareIR*>(ir);
            line(indent, fmt::format("cmp {}, {}", compare->lhs, compare->rhs), ir);
        } break;

        case strata::ir::kConditional: {
            auto conditional = static_cast<const strata::ir::ConditionalIR*>(ir);
            line(indent, fmt::format("if {} {{", strata::dumpBool(conditional->condition.get())), ir);
            block(conditional->thenBlock.get(), indent + 1);
            line(indent, "} else {");
            block(conditional->elseBlock.get(), indent + 1);
            line(indent, "}");
        } break;

        case strata::ir::kLoop: {
            auto loop = static_cast<const strata::ir::LoopIR*>(ir);
            line(indent, fmt::format("while {} {{", strata::dumpBool(loop->condition.get())), ir);
            block(loop->body.get(), indent + 1);
            line(indent, "}");
        } break;

        case strata::ir::kParallel: {
            line(indent, "par {");
            for (const auto& branch : static_cast<const strata::ir::ParallelIR*>(ir)->branches) {
                instruction(branch.get(), indent + 1);
            }
            line(indent, "}");
        } break;

        case strata::ir::kSequence: {
            line(indent, "seq {");
            block(ir, indent + 1);
            line(indent, "}");
        } break;
        }
    }

    bool m_withLiveness;
    std::string m_out;
};

} // namespace

namespace strata {

std::string dumpExpr(const ast::ExprAST* expr) {
    switch (expr->exprType) {
    case ast::kBinaryOp: {
        auto binop = static_cast<const ast::BinaryOpAST*>(expr);
        return fmt::format("{} {} {}", operand(binop->lhs.get()), operatorSymbol(binop->op),
                operand(binop->rhs.get()));
    }

    case ast::kCall: {
        auto call = static_cast<const ast::CallAST*>(expr);
        return fmt::format("{}({})", call->name, exprList(call->arguments));
    }

    case ast::kIdentifier:
        return static_cast<const ast::IdentifierAST*>(expr)->name;

    case ast::kIntegerLiteral:
        return fmt::format("{}", static_cast<const ast::IntegerLiteralAST*>(expr)->value);
    }

    return "?";
}

std::string dumpBool(const ast::BoolAST* cond) {
    switch (cond->boolType) {
    case ast::kAnd: {
        auto andAST = static_cast<const ast::AndAST*>(cond);
        return fmt::format("({} && {})", dumpBool(andAST->lhs.get()), dumpBool(andAST->rhs.get()));
    }

    case ast::kCompare: {
        auto compare = static_cast<const ast::CompareAST*>(cond);
        return fmt::format("{} {} {}", operand(compare->lhs.get()), relOpSymbol(compare->relOp),
                operand(compare->rhs.get()));
    }

    case ast::kFlag:
        return fmt::format("@{}", static_cast<const ast::FlagAST*>(cond)->name);

    case ast::kNot:
        return fmt::format("!{}", dumpBool(static_cast<const ast::NotAST*>(cond)->operand.get()));

    case ast::kOr: {
        auto orAST = static_cast<const ast::OrAST*>(cond);
        return fmt::format("({} || {})", dumpBool(orAST->lhs.get()), dumpBool(orAST->rhs.get()));
    }
    }

    return "?";
}

std::string dumpSource(const ast::StmtAST* stmt) {
    SourceDumper dumper;
    return dumper.dump(stmt);
}

std::string dumpIR(const ir::IR* ir, bool withLiveness) {
    IRDumper dumper(withLiveness);
    return dumper.dump(ir);
}

} // namespace strata
