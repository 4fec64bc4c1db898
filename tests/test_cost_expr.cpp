#include "test_common.h"

#include "caproute/cost_expr.h"
#include "caproute/errors.h"

#include <cmath>
#include <string>

using caproute::CostExpr;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static bool rejects(const std::string& src) {
    try {
        CostExpr::compile(src);
    } catch (const caproute::CatalogAuthoringError&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: linear expression over N
    {
        auto e = CostExpr::compile("2000 + 0.5 * N");
        expect_true(near(e.eval(0), 2000.0), "2000 + 0.5*N at 0");
        expect_true(near(e.eval(100), 2050.0), "2000 + 0.5*N at 100");
        expect_true(e.source() == "2000 + 0.5 * N", "source kept");
    }

    // Test 2: precedence, associativity, unary minus
    {
        expect_true(near(CostExpr::compile("1 + 2 * 3").eval(0), 7.0), "mul before add");
        expect_true(near(CostExpr::compile("(1 + 2) * 3").eval(0), 9.0), "parens");
        expect_true(near(CostExpr::compile("10 - 4 - 3").eval(0), 3.0), "sub left assoc");
        expect_true(near(CostExpr::compile("2 ^ 3 ^ 2").eval(0), 512.0), "pow right assoc");
        expect_true(near(CostExpr::compile("-2 ^ 2").eval(0), -4.0), "unary minus binds looser than pow");
        expect_true(near(CostExpr::compile("-N + 10").eval(4), 6.0), "unary minus on N");
    }

    // Test 3: functions
    {
        expect_true(near(CostExpr::compile("ceil(N / 100)").eval(250), 3.0), "ceil");
        expect_true(near(CostExpr::compile("floor(N / 100)").eval(250), 2.0), "floor");
        expect_true(near(CostExpr::compile("round(2.5)").eval(0), 3.0), "round half away");
        expect_true(near(CostExpr::compile("abs(0 - N)").eval(7), 7.0), "abs");
        expect_true(near(CostExpr::compile("sqrt(N)").eval(16), 4.0), "sqrt");
        expect_true(near(CostExpr::compile("log2(N)").eval(8), 3.0), "log2");
        expect_true(near(CostExpr::compile("log10(N)").eval(1000), 3.0), "log10");
        expect_true(near(CostExpr::compile("min(N, 10, 20)").eval(50), 10.0), "min variadic");
        expect_true(near(CostExpr::compile("max(N, 10)").eval(5), 10.0), "max");
        expect_true(near(CostExpr::compile("100 * log(N + 1)").eval(0), 0.0), "log(1) is 0");
    }

    // Test 4: constant and linear constructors
    {
        expect_true(near(CostExpr::constant(42).eval(1e6), 42.0), "constant ignores N");
        auto l = CostExpr::linear(5, 2);
        expect_true(near(l.eval(10), 25.0), "linear base + per_item*N");
        expect_true(near(CostExpr().eval(3), 0.0), "default is zero");
    }

    // Test 5: non-finite results are returned, not thrown
    {
        auto e = CostExpr::compile("1 / N");
        expect_true(std::isinf(e.eval(0)), "division by zero yields inf");
        expect_true(std::isnan(CostExpr::compile("sqrt(N)").eval(-1)), "sqrt of negative yields nan");
    }

    // Test 6: authoring errors
    {
        expect_true(rejects(""), "empty");
        expect_true(rejects("2 +"), "dangling operator");
        expect_true(rejects("(N + 1"), "unbalanced paren");
        expect_true(rejects("M * 2"), "unknown identifier");
        expect_true(rejects("exp(N)"), "unknown function");
        expect_true(rejects("sqrt(1, 2)"), "arity of unary fn");
        expect_true(rejects("max(1)"), "arity of variadic fn");
        expect_true(rejects("N N"), "trailing tokens");
        std::string deep(100, '(');
        expect_true(rejects(deep + "1" + std::string(100, ')')), "nesting limit");
    }

    // Test 7: copies share the compiled tree
    {
        auto a = CostExpr::compile("3 * N");
        CostExpr b = a;
        expect_true(near(b.eval(2), 6.0), "copy evaluates");
    }

    // Test 8: monotonicity is decided on the tree, not on sampled N
    {
        const char* up[] = {"42", "200 * N", "3000 + 500 * N", "ceil(N / 100) * 50", "log(N + 1)",
                            "max(100, 2 * N)", "min(N, 500)", "sqrt(N) * 3 + 1", "N ^ 2", "2 ^ N",
                            "abs(N + 1)", "-(0 - N)", "(N + 1) * (N + 2)", "0.5 ^ (0 - N)"};
        for (const char* src : up) {
            const std::string why = CostExpr::compile(src).monotonicity_issue();
            expect_true(why.empty(), std::string(src) + " should be accepted: " + why);
        }
        expect_true(CostExpr::linear(5, 2).monotonicity_issue().empty(), "linear with positive slope");
        expect_true(!CostExpr::linear(5, -2).monotonicity_issue().empty(), "linear with negative slope");

        const char* rejected[] = {"N + 10 * max(0, 1 - abs(N - 7))", "1000 - N", "N - N", "abs(N - 7)",
                                  "1000 / (N + 1)", "(N - 3) * N", "N ^ N", "(N - 3) ^ 2", "max(N, 10 - N)"};
        for (const char* src : rejected) {
            expect_true(!CostExpr::compile(src).monotonicity_issue().empty(), std::string(src) + " should be rejected");
        }
        // dips between 5 and 10, passes at every integer the import grid samples
        auto bump = CostExpr::compile("N + 10 * max(0, 1 - abs(N - 7))");
        expect_true(near(bump.eval(7), 17.0) && near(bump.eval(8), 8.0), "dip is real");
        expect_true(CostExpr::compile("1000 - N").monotonicity_issue() == "decreases as N grows", "decreasing reported");
    }

    std::cerr << "test_cost_expr: ALL PASSED" << std::endl;
    return 0;
}
