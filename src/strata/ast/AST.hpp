#ifndef SRC_STRATA_AST_AST_HPP_
#define SRC_STRATA_AST_AST_HPP_

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace strata {
namespace ast {

// Source trees arrive already parsed. Statements, value expressions and boolean expressions are three separate
// hierarchies, each discriminated by its type tag. Value and boolean expressions are also reused as the operands of
// target IR instructions, see ir/IR.hpp.

enum StmtType {
    kConditional,
    kFunctionDef,
    kLoop,
    kMultiAssign,
    kNop,
    kReturn,
    kScopedBinding,
    kSequence
};

enum ExprType {
    kBinaryOp,
    kCall,
    kIdentifier,
    kIntegerLiteral
};

enum BoolType {
    kAnd,
    kCompare,
    kFlag,
    kNot,
    kOr
};

enum BinaryOperator {
    kAdd,
    kMul,
    kDiv,
    kMod
};

enum RelOp {
    kEq,
    kNeq,
    kLt,
    kLte,
    kGt,
    kGte
};

struct ExprAST {
    ExprAST() = delete;
    virtual ~ExprAST() = default;

    ExprType exprType;

protected:
    explicit ExprAST(ExprType type): exprType(type) {}
};

struct BinaryOpAST : public ExprAST {
    BinaryOpAST(std::unique_ptr<ExprAST> l, BinaryOperator o, std::unique_ptr<ExprAST> r):
        ExprAST(kBinaryOp), lhs(std::move(l)), op(o), rhs(std::move(r)) {}
    virtual ~BinaryOpAST() = default;

    std::unique_ptr<ExprAST> lhs;
    BinaryOperator op;
    std::unique_ptr<ExprAST> rhs;
};

struct CallAST : public ExprAST {
    explicit CallAST(std::string n): ExprAST(kCall), name(std::move(n)) {}
    CallAST(std::string n, std::vector<std::unique_ptr<ExprAST>> args):
        ExprAST(kCall), name(std::move(n)), arguments(std::move(args)) {}
    virtual ~CallAST() = default;

    std::string name;
    std::vector<std::unique_ptr<ExprAST>> arguments;
};

struct IdentifierAST : public ExprAST {
    explicit IdentifierAST(std::string n): ExprAST(kIdentifier), name(std::move(n)) {}
    virtual ~IdentifierAST() = default;

    std::string name;
};

struct IntegerLiteralAST : public ExprAST {
    explicit IntegerLiteralAST(int64_t v): ExprAST(kIntegerLiteral), value(v) {}
    virtual ~IntegerLiteralAST() = default;

    int64_t value;
};

struct BoolAST {
    BoolAST() = delete;
    virtual ~BoolAST() = default;

    BoolType boolType;

protected:
    explicit BoolAST(BoolType type): boolType(type) {}
};

struct AndAST : public BoolAST {
    AndAST(std::unique_ptr<BoolAST> l, std::unique_ptr<BoolAST> r):
        BoolAST(kAnd), lhs(std::move(l)), rhs(std::move(r)) {}
    virtual ~AndAST() = default;

    std::unique_ptr<BoolAST> lhs;
    std::unique_ptr<BoolAST> rhs;
};

struct CompareAST : public BoolAST {
    CompareAST(std::unique_ptr<ExprAST> l, RelOp r, std::unique_ptr<ExprAST> rh):
        BoolAST(kCompare), lhs(std::move(l)), relOp(r), rhs(std::move(rh)) {}
    virtual ~CompareAST() = default;

    std::unique_ptr<ExprAST> lhs;
    RelOp relOp;
    std::unique_ptr<ExprAST> rhs;
};

// Reference to a boolean state produced by an ir::CompareIR. Flags are only produced by lowering, never parsed.
struct FlagAST : public BoolAST {
    explicit FlagAST(std::string n): BoolAST(kFlag), name(std::move(n)) {}
    virtual ~FlagAST() = default;

    std::string name;
};

struct NotAST : public BoolAST {
    explicit NotAST(std::unique_ptr<BoolAST> o): BoolAST(kNot), operand(std::move(o)) {}
    virtual ~NotAST() = default;

    std::unique_ptr<BoolAST> operand;
};

struct OrAST : public BoolAST {
    OrAST(std::unique_ptr<BoolAST> l, std::unique_ptr<BoolAST> r):
        BoolAST(kOr), lhs(std::move(l)), rhs(std::move(r)) {}
    virtual ~OrAST() = default;

    std::unique_ptr<BoolAST> lhs;
    std::unique_ptr<BoolAST> rhs;
};

struct StmtAST {
    StmtAST() = delete;
    virtual ~StmtAST() = default;

    StmtType stmtType;

protected:
    explicit StmtAST(StmtType type): stmtType(type) {}
};

struct ConditionalAST : public StmtAST {
    ConditionalAST(std::unique_ptr<BoolAST> cond, std::unique_ptr<StmtAST> t, std::unique_ptr<StmtAST> e):
        StmtAST(kConditional), condition(std::move(cond)), thenBlock(std::move(t)), elseBlock(std::move(e)) {}
    virtual ~ConditionalAST() = default;

    std::unique_ptr<BoolAST> condition;
    std::unique_ptr<StmtAST> thenBlock;
    std::unique_ptr<StmtAST> elseBlock;
};

// The function |name| is visible in |rest| only. Its own |body| cannot call it.
struct FunctionDefAST : public StmtAST {
    FunctionDefAST(std::string n, std::vector<std::string> params, std::unique_ptr<StmtAST> b,
            std::unique_ptr<StmtAST> r):
        StmtAST(kFunctionDef), name(std::move(n)), parameters(std::move(params)), body(std::move(b)),
        rest(std::move(r)) {}
    virtual ~FunctionDefAST() = default;

    std::string name;
    std::vector<std::string> parameters;
    std::unique_ptr<StmtAST> body;
    std::unique_ptr<StmtAST> rest;
};

struct LoopAST : public StmtAST {
    LoopAST(std::unique_ptr<BoolAST> cond, std::unique_ptr<StmtAST> b):
        StmtAST(kLoop), condition(std::move(cond)), body(std::move(b)) {}
    virtual ~LoopAST() = default;

    std::unique_ptr<BoolAST> condition;
    std::unique_ptr<StmtAST> body;
};

// Assigns |value| to the ordered |names|. Only a call can produce more than one value.
struct MultiAssignAST : public StmtAST {
    MultiAssignAST(std::vector<std::string> n, std::unique_ptr<ExprAST> v):
        StmtAST(kMultiAssign), names(std::move(n)), value(std::move(v)) {}
    virtual ~MultiAssignAST() = default;

    std::vector<std::string> names;
    std::unique_ptr<ExprAST> value;
};

struct NopAST : public StmtAST {
    NopAST(): StmtAST(kNop) {}
    virtual ~NopAST() = default;
};

struct ReturnAST : public StmtAST {
    ReturnAST(): StmtAST(kReturn) {}
    explicit ReturnAST(std::vector<std::unique_ptr<ExprAST>> v): StmtAST(kReturn), values(std::move(v)) {}
    virtual ~ReturnAST() = default;

    std::vector<std::unique_ptr<ExprAST>> values;
};

// Declares |name| initialized to |value|, shadowing any outer binding for the duration of |rest|.
struct ScopedBindingAST : public StmtAST {
    ScopedBindingAST(std::string n, std::unique_ptr<ExprAST> v, std::unique_ptr<StmtAST> r):
        StmtAST(kScopedBinding), name(std::move(n)), value(std::move(v)), rest(std::move(r)) {}
    virtual ~ScopedBindingAST() = default;

    std::string name;
    std::unique_ptr<ExprAST> value;
    std::unique_ptr<StmtAST> rest;
};

struct SequenceAST : public StmtAST {
    SequenceAST(std::unique_ptr<StmtAST> f, std::unique_ptr<StmtAST> s):
        StmtAST(kSequence), first(std::move(f)), second(std::move(s)) {}
    virtual ~SequenceAST() = default;

    std::unique_ptr<StmtAST> first;
    std::unique_ptr<StmtAST> second;
};

// Deep copies.
std::unique_ptr<ExprAST> clone(const ExprAST* expr);
std::unique_ptr<BoolAST> clone(const BoolAST* cond);
std::unique_ptr<StmtAST> clone(const StmtAST* stmt);

// Structural equality.
bool equal(const ExprAST* a, const ExprAST* b);
bool equal(const BoolAST* a, const BoolAST* b);
bool equal(const StmtAST* a, const StmtAST* b);

// Number of values the function with |body| returns, which is the longest Return statement in the body. Returns
// inside the bodies of nested function definitions belong to those functions and are not counted.
size_t returnArity(const StmtAST* body);

// Names bound by ScopedBindings along the top level of the program, following Sequences and the |rest| of
// FunctionDefs and ScopedBindings but not descending into control flow or function bodies.
std::set<std::string> topLevelBindings(const StmtAST* program);

} // namespace ast
} // namespace strata

#endif // SRC_STRATA_AST_AST_HPP_
