#include "caproute/cost_expr.h"
#include "caproute/errors.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace caproute {

struct CostExpr::Node {
    enum class Kind { NUM, VAR, NEG, ADD, SUB, MUL, DIV, POW, CALL } kind{Kind::NUM};
    double value{0.0};
    std::string fn;
    std::vector<std::shared_ptr<const Node>> args;
};

using NodePtr = std::shared_ptr<const CostExpr::Node>;

namespace {

NodePtr make_num(double v) {
    auto n = std::make_shared<CostExpr::Node>();
    n->kind = CostExpr::Node::Kind::NUM;
    n->value = v;
    return n;
}

NodePtr make_var() {
    auto n = std::make_shared<CostExpr::Node>();
    n->kind = CostExpr::Node::Kind::VAR;
    return n;
}

NodePtr make_op(CostExpr::Node::Kind k, std::vector<NodePtr> args) {
    auto n = std::make_shared<CostExpr::Node>();
    n->kind = k;
    n->args = std::move(args);
    return n;
}

bool is_unary_fn(const std::string& f) {
    return f == "ceil" || f == "floor" || f == "round" || f == "abs" ||
           f == "sqrt" || f == "log" || f == "log2" || f == "log10";
}

bool is_variadic_fn(const std::string& f) {
    return f == "min" || f == "max";
}

std::string fmt_num(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    return buf;
}

// Recursive-descent parser. Errors carry the byte offset into the source.
class Parser {
public:
    explicit Parser(const std::string& s) : s_(s) {}

    NodePtr parse_all() {
        NodePtr e = parse_expr();
        skip_ws();
        if (pos_ != s_.size()) fail("unexpected '" + std::string(1, s_[pos_]) + "'");
        return e;
    }

private:
    const std::string& s_;
    size_t pos_{0};
    int depth_{0};

    [[noreturn]] void fail(const std::string& why) const {
        throw CatalogAuthoringError("cost expression \"" + s_ + "\" at offset " +
                                    std::to_string(pos_) + ": " + why);
    }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) pos_++;
    }

    bool accept(char c) {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == c) { pos_++; return true; }
        return false;
    }

    NodePtr parse_expr() {
        if (++depth_ > 64) fail("expression nested too deeply");
        NodePtr lhs = parse_term();
        while (true) {
            if (accept('+')) lhs = make_op(CostExpr::Node::Kind::ADD, {lhs, parse_term()});
            else if (accept('-')) lhs = make_op(CostExpr::Node::Kind::SUB, {lhs, parse_term()});
            else break;
        }
        depth_--;
        return lhs;
    }

    NodePtr parse_term() {
        NodePtr lhs = parse_unary();
        while (true) {
            if (accept('*')) lhs = make_op(CostExpr::Node::Kind::MUL, {lhs, parse_unary()});
            else if (accept('/')) lhs = make_op(CostExpr::Node::Kind::DIV, {lhs, parse_unary()});
            else break;
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (accept('-')) {
            if (++depth_ > 64) fail("expression nested too deeply");
            NodePtr inner = parse_unary();
            depth_--;
            return make_op(CostExpr::Node::Kind::NEG, {inner});
        }
        if (accept('+')) return parse_unary();
        return parse_power();
    }

    NodePtr parse_power() {
        NodePtr base = parse_primary();
        if (accept('^')) {
            if (++depth_ > 64) fail("expression nested too deeply");
            NodePtr ex = parse_unary();
            depth_--;
            return make_op(CostExpr::Node::Kind::POW, {base, ex});
        }
        return base;
    }

    NodePtr parse_primary() {
        skip_ws();
        if (pos_ >= s_.size()) fail("unexpected end of expression");
        char c = s_[pos_];

        if (c == '(') {
            pos_++;
            NodePtr e = parse_expr();
            if (!accept(')')) fail("missing ')'");
            return e;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            const char* begin = s_.c_str() + pos_;
            char* end = nullptr;
            double v = std::strtod(begin, &end);
            if (end == begin) fail("bad number");
            pos_ += static_cast<size_t>(end - begin);
            if (!std::isfinite(v)) fail("number out of range");
            return make_num(v);
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = pos_;
            while (pos_ < s_.size() &&
                   (std::isalnum(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '_')) pos_++;
            std::string ident = s_.substr(start, pos_ - start);

            if (ident == "N" || ident == "n") return make_var();

            if (!is_unary_fn(ident) && !is_variadic_fn(ident)) {
                pos_ = start;
                fail("unknown identifier '" + ident + "'");
            }
            if (!accept('(')) fail("expected '(' after " + ident);
            std::vector<NodePtr> args;
            args.push_back(parse_expr());
            while (accept(',')) args.push_back(parse_expr());
            if (!accept(')')) fail("missing ')' after arguments of " + ident);

            if (is_unary_fn(ident) && args.size() != 1) fail(ident + " takes exactly one argument");
            if (is_variadic_fn(ident) && args.size() < 2) fail(ident + " takes at least two arguments");

            auto n = std::make_shared<CostExpr::Node>();
            n->kind = CostExpr::Node::Kind::CALL;
            n->fn = ident;
            n->args = std::move(args);
            return n;
        }

        fail("unexpected '" + std::string(1, c) + "'");
    }
};

double eval_node(const CostExpr::Node& n, double x) {
    using K = CostExpr::Node::Kind;
    switch (n.kind) {
        case K::NUM: return n.value;
        case K::VAR: return x;
        case K::NEG: return -eval_node(*n.args[0], x);
        case K::ADD: return eval_node(*n.args[0], x) + eval_node(*n.args[1], x);
        case K::SUB: return eval_node(*n.args[0], x) - eval_node(*n.args[1], x);
        case K::MUL: return eval_node(*n.args[0], x) * eval_node(*n.args[1], x);
        case K::DIV: return eval_node(*n.args[0], x) / eval_node(*n.args[1], x);
        case K::POW: return std::pow(eval_node(*n.args[0], x), eval_node(*n.args[1], x));
        case K::CALL: {
            const double a = eval_node(*n.args[0], x);
            if (n.fn == "ceil") return std::ceil(a);
            if (n.fn == "floor") return std::floor(a);
            if (n.fn == "round") return std::round(a);
            if (n.fn == "abs") return std::fabs(a);
            if (n.fn == "sqrt") return std::sqrt(a);
            if (n.fn == "log") return std::log(a);
            if (n.fn == "log2") return std::log2(a);
            if (n.fn == "log10") return std::log10(a);
            double acc = a;
            for (size_t i = 1; i < n.args.size(); i++) {
                const double b = eval_node(*n.args[i], x);
                acc = (n.fn == "min") ? std::fmin(acc, b) : std::fmax(acc, b);
            }
            return acc;
        }
    }
    return 0.0;
}

bool depends_on_n(const CostExpr::Node& n) {
    if (n.kind == CostExpr::Node::Kind::VAR) return true;
    for (const auto& a : n.args)
        if (depends_on_n(*a)) return true;
    return false;
}

// Direction and sign of a subexpression over N >= 0.
enum class Trend { CONST, UP, DOWN, UNKNOWN };
enum class Sign { NONNEG, NONPOS, ANY };

struct Shape {
    Trend trend{Trend::UNKNOWN};
    Sign sign{Sign::ANY};
    double value{0.0};   // valid when trend == CONST
};

Trend flip(Trend t) {
    if (t == Trend::UP) return Trend::DOWN;
    if (t == Trend::DOWN) return Trend::UP;
    return t;
}

Sign flip(Sign s) {
    if (s == Sign::NONNEG) return Sign::NONPOS;
    if (s == Sign::NONPOS) return Sign::NONNEG;
    return s;
}

Sign sign_of(double v) {
    if (v >= 0.0) return Sign::NONNEG;
    if (v <= 0.0) return Sign::NONPOS;
    return Sign::ANY;   // nan
}

Shape constant_shape(double v) {
    return Shape{Trend::CONST, sign_of(v), v};
}

Shape unknown(std::string* why, const std::string& reason) {
    if (why->empty()) *why = reason;
    return Shape{};
}

Shape negate(Shape s) {
    return Shape{flip(s.trend), flip(s.sign), -s.value};
}

// Trend of a sum; CONST terms do not change the direction.
Trend sum_trend(Trend a, Trend b) {
    if (a == Trend::CONST) return b;
    if (b == Trend::CONST) return a;
    return a == b ? a : Trend::UNKNOWN;
}

Sign sum_sign(Sign a, Sign b) {
    return a == b ? a : Sign::ANY;
}

Shape analyze(const CostExpr::Node& n, std::string* why) {
    using K = CostExpr::Node::Kind;
    if (!depends_on_n(n)) return constant_shape(eval_node(n, 0.0));

    switch (n.kind) {
        case K::NUM: return constant_shape(n.value);
        case K::VAR: return Shape{Trend::UP, Sign::NONNEG, 0.0};
        case K::NEG: return negate(analyze(*n.args[0], why));
        case K::ADD:
        case K::SUB: {
            const Shape a = analyze(*n.args[0], why);
            Shape b = analyze(*n.args[1], why);
            if (n.kind == K::SUB) b = negate(b);
            const Trend t = sum_trend(a.trend, b.trend);
            if (t == Trend::UNKNOWN) return unknown(why, "sum of terms moving in opposite directions");
            return Shape{t, sum_sign(a.sign, b.sign), 0.0};
        }
        case K::MUL: {
            Shape a = analyze(*n.args[0], why);
            Shape b = analyze(*n.args[1], why);
            if (a.trend == Trend::UNKNOWN || b.trend == Trend::UNKNOWN) return unknown(why, "unknown factor");
            if (b.trend == Trend::CONST) std::swap(a, b);
            if (a.trend == Trend::CONST) {
                if (a.value > 0.0) return b;
                if (a.value < 0.0) return negate(b);
                if (a.value == 0.0) return constant_shape(0.0);
                return unknown(why, "factor is not a number");
            }
            if (a.sign == Sign::NONNEG && b.sign == Sign::NONNEG && a.trend == b.trend)
                return Shape{a.trend, Sign::NONNEG, 0.0};
            return unknown(why, "product of N-dependent terms that may be negative or move apart");
        }
        case K::DIV: {
            const Shape a = analyze(*n.args[0], why);
            const Shape b = analyze(*n.args[1], why);
            if (b.trend != Trend::CONST) return unknown(why, "division by a term that depends on N");
            if (a.trend == Trend::UNKNOWN) return a;
            if (b.value > 0.0) return a;
            if (b.value < 0.0) return negate(a);
            return unknown(why, "division by zero");
        }
        case K::POW: {
            const Shape a = analyze(*n.args[0], why);
            const Shape e = analyze(*n.args[1], why);
            if (e.trend == Trend::UNKNOWN) return e;
            if (a.trend == Trend::CONST) {
                if (a.value > 1.0) return Shape{e.trend, Sign::NONNEG, 0.0};
                if (a.value == 1.0) return constant_shape(1.0);
                if (a.value > 0.0) return Shape{flip(e.trend), Sign::NONNEG, 0.0};
                return unknown(why, "N-dependent exponent on a base that is not positive");
            }
            if (e.trend != Trend::CONST) return unknown(why, "both base and exponent depend on N");
            if (a.trend == Trend::UNKNOWN) return a;
            if (e.value == 0.0) return constant_shape(1.0);
            if (a.sign == Sign::NONNEG) {
                if (e.value > 0.0) return Shape{a.trend, Sign::NONNEG, 0.0};
                return Shape{flip(a.trend), Sign::NONNEG, 0.0};
            }
            if (e.value > 0.0 && e.value == std::floor(e.value) && std::fmod(e.value, 2.0) == 1.0) return a;
            return unknown(why, "power of a term that may be negative");
        }
        case K::CALL: {
            std::vector<Shape> args;
            for (const auto& x : n.args) args.push_back(analyze(*x, why));
            const Shape& a = args[0];
            if (n.fn == "min" || n.fn == "max") {
                Trend t = Trend::CONST;
                bool any_nonneg = false, all_nonneg = true, any_nonpos = false, all_nonpos = true;
                for (const auto& s : args) {
                    t = sum_trend(t, s.trend);
                    any_nonneg = any_nonneg || s.sign == Sign::NONNEG;
                    all_nonneg = all_nonneg && s.sign == Sign::NONNEG;
                    any_nonpos = any_nonpos || s.sign == Sign::NONPOS;
                    all_nonpos = all_nonpos && s.sign == Sign::NONPOS;
                }
                if (t == Trend::UNKNOWN) return unknown(why, n.fn + " of terms moving in opposite directions");
                Sign sg = Sign::ANY;
                if (n.fn == "max") sg = any_nonneg ? Sign::NONNEG : (all_nonpos ? Sign::NONPOS : Sign::ANY);
                else sg = all_nonneg ? Sign::NONNEG : (any_nonpos ? Sign::NONPOS : Sign::ANY);
                return Shape{t, sg, 0.0};
            }
            if (a.trend == Trend::UNKNOWN) return a;
            if (n.fn == "abs") {
                if (a.sign == Sign::NONNEG) return a;
                if (a.sign == Sign::NONPOS) return Shape{flip(a.trend), Sign::NONNEG, 0.0};
                return unknown(why, "abs of a term that may change sign");
            }
            if (n.fn == "sqrt") return Shape{a.trend, Sign::NONNEG, 0.0};
            if (n.fn == "log" || n.fn == "log2" || n.fn == "log10") return Shape{a.trend, Sign::ANY, 0.0};
            // ceil floor round: non-decreasing and sign-preserving
            return Shape{a.trend, a.sign, 0.0};
        }
    }
    return unknown(why, "unsupported node");
}

} // namespace

CostExpr::CostExpr() : root_(make_num(0.0)), source_("0") {}

CostExpr CostExpr::compile(const std::string& source) {
    if (source.empty()) throw CatalogAuthoringError("cost expression is empty");
    if (source.size() > 512) throw CatalogAuthoringError("cost expression longer than 512 characters");
    Parser p(source);
    CostExpr e;
    e.root_ = p.parse_all();
    e.source_ = source;
    return e;
}

CostExpr CostExpr::constant(double v) {
    CostExpr e;
    e.root_ = make_num(v);
    e.source_ = fmt_num(v);
    return e;
}

CostExpr CostExpr::linear(double base, double per_item) {
    CostExpr e;
    e.root_ = make_op(Node::Kind::ADD, {make_num(base),
                                        make_op(Node::Kind::MUL, {make_num(per_item), make_var()})});
    e.source_ = fmt_num(base) + " + " + fmt_num(per_item) + " * N";
    return e;
}

double CostExpr::eval(double n) const {
    return eval_node(*root_, n);
}

std::string CostExpr::monotonicity_issue() const {
    std::string why;
    const Shape s = analyze(*root_, &why);
    if (s.trend == Trend::CONST || s.trend == Trend::UP) return "";
    if (s.trend == Trend::DOWN) return "decreases as N grows";
    return why.empty() ? "cannot be shown non-decreasing in N" : why;
}

} // namespace caproute
