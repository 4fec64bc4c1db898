#pragma once

#include <memory>
#include <string>

namespace caproute {

// CostExpr: compiled arithmetic expression over the scale parameter N.
//
// Grammar:
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/') unary)*
//   unary   := '-' unary | power
//   power   := primary ('^' unary)?
//   primary := number | 'N' | ident '(' expr (',' expr)* ')' | '(' expr ')'
//
// Functions: ceil floor round abs sqrt log log2 log10 (one argument),
// min max (two or more).
//
// Compiled expressions are immutable and cheap to copy (shared AST).
class CostExpr {
public:
    struct Node;

    CostExpr();  // constant 0

    // Throws CatalogAuthoringError with the offending position on parse error.
    static CostExpr compile(const std::string& source);
    static CostExpr constant(double v);
    // base + per_item * N
    static CostExpr linear(double base, double per_item);

    double eval(double n) const;
    const std::string& source() const { return source_; }

    // "" when the expression is provably non-decreasing in N for N >= 0,
    // else what stopped the proof. Works on the tree, not on samples, so
    // N - N and similar forms are rejected.
    std::string monotonicity_issue() const;

private:
    std::shared_ptr<const Node> root_;
    std::string source_;
};

} // namespace caproute
