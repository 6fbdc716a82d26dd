#pragma once

#include "const/const.hpp"
#include "hir/hir.hpp"
#include "hir/typeck_results.hpp"
#include "span/span.hpp"
#include "type/type.hpp"
#include "utils/error.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// Typed, normalized patterns handed to exhaustiveness checking and match
// lowering. Every node exclusively owns its subpatterns.
namespace thir {

using type::TypeId;

struct Pat;
using PatPtr = std::unique_ptr<Pat>;

enum class BorrowKind { Shared, Mut };

struct BindingMode {
    enum class Kind { ByValue, ByRef };

    Kind kind = Kind::ByValue;
    BorrowKind borrow = BorrowKind::Shared;

    static BindingMode by_value() { return BindingMode{Kind::ByValue, BorrowKind::Shared}; }
    static BindingMode by_ref(BorrowKind borrow) { return BindingMode{Kind::ByRef, borrow}; }

    bool operator==(const BindingMode&) const = default;
};

struct LocalVarId {
    hir::HirId id = 0;

    bool operator==(const LocalVarId&) const = default;
};

enum class Variance { Covariant, Contravariant, Invariant };

struct CanonicalUserTypeAnnotation {
    hir::UserType user_ty;
    span::Span span = span::Span::invalid();
    TypeId inferred_ty = type::invalid_type_id;

    bool operator==(const CanonicalUserTypeAnnotation&) const = default;
};

struct Ascription {
    CanonicalUserTypeAnnotation annotation;
    Variance variance = Variance::Covariant;

    bool operator==(const Ascription&) const = default;
};

struct FieldPat {
    size_t field = 0;
    PatPtr pattern;
};

// --- Pattern kinds ---

struct Wild {};

// A user-written type annotation, kept for the borrow checker and erased
// before exhaustiveness checking.
struct AscribeUserType {
    Ascription ascription;
    PatPtr subpattern;
};

struct Binding {
    hir::Mutability mutability = hir::Mutability::Not;
    std::string name;
    BindingMode mode;
    LocalVarId var;
    // Type of the bound variable; differs from the node type for `ref` bindings.
    TypeId ty = type::invalid_type_id;
    PatPtr subpattern;
    bool is_primary = true;
};

struct Variant {
    type::AdtId adt = 0;
    type::GenericArgs args;
    size_t variant_index = 0;
    std::vector<FieldPat> subpatterns;
};

// A struct, union, tuple or single-variant enum: no discriminant to test.
struct Leaf {
    std::vector<FieldPat> subpatterns;
};

struct Deref {
    PatPtr subpattern;
};

struct Constant {
    const_eval::Const value;
};

// Non-empty interval; `lo == hi` with an inclusive end is a Constant instead.
struct Range {
    const_eval::Const lo;
    const_eval::Const hi;
    hir::RangeEnd end = hir::RangeEnd::Included;
};

struct Slice {
    std::vector<PatPtr> prefix;
    PatPtr slice;
    std::vector<PatPtr> suffix;
};

struct Array {
    std::vector<PatPtr> prefix;
    PatPtr slice;
    std::vector<PatPtr> suffix;
};

struct Or {
    std::vector<PatPtr> pats;
};

struct Error {
    DiagnosticId diagnostic;
};

using PatKind = std::variant<
    Wild,
    AscribeUserType,
    Binding,
    Variant,
    Leaf,
    Deref,
    Constant,
    Range,
    Slice,
    Array,
    Or,
    Error
>;

struct Pat {
    TypeId ty = type::invalid_type_id;
    span::Span span = span::Span::invalid();
    PatKind kind;

    template <typename T>
    const T* as() const { return std::get_if<T>(&kind); }
    template <typename T>
    bool is() const { return std::holds_alternative<T>(kind); }
};

inline PatPtr make_pat(TypeId ty, span::Span span, PatKind kind) {
    return std::make_unique<Pat>(Pat{ty, span, std::move(kind)});
}

// Deep structural equality.
bool operator==(const Pat& lhs, const Pat& rhs);
bool operator==(const FieldPat& lhs, const FieldPat& rhs);

// Direct subpatterns of `pat`, in source order.
std::vector<const Pat*> children(const Pat& pat);

// Calls `fn` on `pat` and every pattern below it, parents first.
template <typename Fn>
void walk(const Pat& pat, Fn&& fn) {
    fn(pat);
    for (const Pat* child : children(pat)) {
        walk(*child, fn);
    }
}

// Number of Error nodes in the tree.
size_t count_errors(const Pat& pat);

} // namespace thir
