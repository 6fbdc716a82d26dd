#pragma once

#include "span/span.hpp"
#include "type/type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Surface patterns as they leave name resolution and type checking. Only the
// shapes that can occur inside a pattern are modelled.
namespace hir {

using HirId = std::uint32_t;

struct Expr;
struct Pattern;

using ExprPtr = std::unique_ptr<Expr>;
using PatternPtr = std::unique_ptr<Pattern>;

enum class Mutability { Not, Mut };

enum class RangeEnd { Included, Excluded };

struct Ident {
    std::string name;
    span::Span span = span::Span::invalid();
};

struct QPath {
    std::vector<Ident> segments;
    span::Span span = span::Span::invalid();
};

// --- Name resolution result ---

struct Res {
    enum class Kind { Def, SelfTyParam, SelfTyAlias, SelfCtor, Local, Err };

    Kind kind = Kind::Err;
    type::DefKind def_kind = type::DefKind::Const;
    type::DefId def_id = type::invalid_def_id;

    static Res def(type::DefKind def_kind, type::DefId def_id) {
        return Res{.kind = Kind::Def, .def_kind = def_kind, .def_id = def_id};
    }
    static Res self_ty_param() { return Res{.kind = Kind::SelfTyParam}; }
    static Res self_ty_alias() { return Res{.kind = Kind::SelfTyAlias}; }
    static Res self_ctor() { return Res{.kind = Kind::SelfCtor}; }
    static Res local() { return Res{.kind = Kind::Local}; }
    static Res err() { return Res{.kind = Kind::Err}; }

    bool is_def(type::DefKind kind_) const { return kind == Kind::Def && def_kind == kind_; }
};

// --- Expressions embedded in patterns ---

struct Literal {
    // No member initializers here: they would leave `Value` without a default
    // constructor until Literal is complete.
    struct Integer {
        uint64_t value;
    };
    struct Float {
        std::string symbol;
    };
    struct String {
        std::string value;
    };
    using Value = std::variant<Integer, Float, bool, char32_t, String>;

    Value value;
    span::Span span = span::Span::invalid();
};

struct LiteralExpr {
    Literal literal;
};

// Unary minus. Inside a pattern the operand is always a literal.
struct NegateExpr {
    ExprPtr operand;
};

struct PathExpr {
    QPath path;
};

// `const { ... }` used as a pattern.
struct ConstBlock {
    type::DefId def_id = type::invalid_def_id;
    HirId hir_id = 0;
    ExprPtr body;
};

struct ConstBlockExpr {
    ConstBlock block;
};

using ExprVariant = std::variant<LiteralExpr, NegateExpr, PathExpr, ConstBlockExpr>;

struct Expr {
    HirId hir_id = 0;
    ExprVariant value;
    span::Span span = span::Span::invalid();

    Expr(HirId id, ExprVariant&& val, span::Span sp = span::Span::invalid())
        : hir_id(id), value(std::move(val)), span(sp) {}

    Expr(const Expr&) = delete;
    Expr& operator=(const Expr&) = delete;
    Expr(Expr&&) noexcept = default;
    Expr& operator=(Expr&&) noexcept = default;
};

// --- Patterns ---

struct WildcardPattern {};

struct BindingAnnotation {
    bool by_ref = false;
    Mutability mutability = Mutability::Not;
};

struct BindingPattern {
    BindingAnnotation annotation;
    // Id of the variable's defining binding. Equal to the pattern's own id
    // for the first occurrence of a name.
    HirId var_id = 0;
    Ident ident;
    PatternPtr subpattern;
};

struct PatternField {
    HirId hir_id = 0;
    Ident ident;
    PatternPtr pattern;
    span::Span span = span::Span::invalid();
};

struct StructPattern {
    QPath path;
    std::vector<PatternField> fields;
    bool has_rest = false;
};

struct TupleStructPattern {
    QPath path;
    std::vector<PatternPtr> elements;
    std::optional<size_t> dotdot_pos;
};

struct OrPattern {
    std::vector<PatternPtr> alternatives;
};

struct PathPattern {
    QPath path;
};

struct TuplePattern {
    std::vector<PatternPtr> elements;
    std::optional<size_t> dotdot_pos;
};

struct BoxPattern {
    PatternPtr subpattern;
};

struct ReferencePattern {
    PatternPtr subpattern;
    Mutability mutability = Mutability::Not;
};

struct LiteralPattern {
    ExprPtr expr;
};

struct RangePattern {
    ExprPtr lo;
    ExprPtr hi;
    RangeEnd end = RangeEnd::Included;
};

struct SlicePattern {
    std::vector<PatternPtr> prefix;
    PatternPtr slice;
    std::vector<PatternPtr> suffix;
};

using PatternVariant = std::variant<
    WildcardPattern,
    BindingPattern,
    StructPattern,
    TupleStructPattern,
    OrPattern,
    PathPattern,
    TuplePattern,
    BoxPattern,
    ReferencePattern,
    LiteralPattern,
    RangePattern,
    SlicePattern
>;

struct Pattern {
    HirId hir_id = 0;
    PatternVariant value;
    span::Span span = span::Span::invalid();

    Pattern(HirId id, PatternVariant&& val, span::Span sp = span::Span::invalid())
        : hir_id(id), value(std::move(val)), span(sp) {}

    Pattern(const Pattern&) = delete;
    Pattern& operator=(const Pattern&) = delete;
    Pattern(Pattern&&) noexcept = default;
    Pattern& operator=(Pattern&&) noexcept = default;
};

} // namespace hir
