#pragma once

#include "thir/pattern.hpp"

#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace thir {

/**
 * @brief Structural rewrite of a pattern tree into a fresh tree.
 *
 * One `fold` overload per pattern kind rebuilds the node from its folded
 * children. Scalar payloads (types, spans, constants, names) go through the
 * value-copy hooks `fold_type` and `fold_span`. A derived folder hides
 * whichever functions it wants to change and calls the `super_` variants to
 * keep the default recursion. The input tree is never modified.
 *
 * The per-kind hooks form one overload set, so a folder that redefines one of
 * them must bring the rest back with `using PatternFolder::fold;`. A hook may
 * return any `PatKind` alternative, not only its own kind.
 */
template <typename Derived>
class PatternFolder {
protected:
    Derived& derived() { return *static_cast<Derived*>(this); }

public:
    Pat fold_pattern(const Pat& pat) { return super_fold_pattern(pat); }

    Pat super_fold_pattern(const Pat& pat) {
        return Pat{
            .ty = derived().fold_type(pat.ty),
            .span = derived().fold_span(pat.span),
            .kind = derived().fold_kind(pat.kind),
        };
    }

    PatKind fold_kind(const PatKind& kind) {
        return std::visit([this](const auto& node) -> PatKind {
            return derived().fold(node);
        }, kind);
    }

    TypeId fold_type(TypeId ty) { return ty; }
    span::Span fold_span(span::Span span) { return span; }

    PatPtr fold_ptr(const PatPtr& pat) {
        if (!pat) {
            return nullptr;
        }
        return std::make_unique<Pat>(derived().fold_pattern(*pat));
    }

    std::vector<PatPtr> fold_list(const std::vector<PatPtr>& pats) {
        std::vector<PatPtr> result;
        result.reserve(pats.size());
        for (const auto& pat : pats) {
            result.push_back(derived().fold_ptr(pat));
        }
        return result;
    }

    std::vector<FieldPat> fold_fields(const std::vector<FieldPat>& fields) {
        std::vector<FieldPat> result;
        result.reserve(fields.size());
        for (const auto& field : fields) {
            result.push_back(FieldPat{field.field, derived().fold_ptr(field.pattern)});
        }
        return result;
    }

    Wild fold(const Wild&) { return Wild{}; }

    AscribeUserType fold(const AscribeUserType& node) {
        AscribeUserType result;
        result.ascription = node.ascription;
        result.ascription.annotation.inferred_ty = derived().fold_type(node.ascription.annotation.inferred_ty);
        result.ascription.annotation.span = derived().fold_span(node.ascription.annotation.span);
        result.subpattern = derived().fold_ptr(node.subpattern);
        return result;
    }

    Binding fold(const Binding& node) {
        Binding result;
        result.mutability = node.mutability;
        result.name = node.name;
        result.mode = node.mode;
        result.var = node.var;
        result.ty = derived().fold_type(node.ty);
        result.subpattern = derived().fold_ptr(node.subpattern);
        result.is_primary = node.is_primary;
        return result;
    }

    Variant fold(const Variant& node) {
        Variant result;
        result.adt = node.adt;
        result.args.reserve(node.args.size());
        for (TypeId arg : node.args) {
            result.args.push_back(derived().fold_type(arg));
        }
        result.variant_index = node.variant_index;
        result.subpatterns = derived().fold_fields(node.subpatterns);
        return result;
    }

    Leaf fold(const Leaf& node) { return Leaf{derived().fold_fields(node.subpatterns)}; }

    Deref fold(const Deref& node) { return Deref{derived().fold_ptr(node.subpattern)}; }

    Constant fold(const Constant& node) {
        Constant result{node.value};
        result.value.ty = derived().fold_type(node.value.ty);
        return result;
    }

    Range fold(const Range& node) {
        Range result{node.lo, node.hi, node.end};
        result.lo.ty = derived().fold_type(node.lo.ty);
        result.hi.ty = derived().fold_type(node.hi.ty);
        return result;
    }

    Slice fold(const Slice& node) {
        return Slice{
            .prefix = derived().fold_list(node.prefix),
            .slice = derived().fold_ptr(node.slice),
            .suffix = derived().fold_list(node.suffix),
        };
    }

    Array fold(const Array& node) {
        return Array{
            .prefix = derived().fold_list(node.prefix),
            .slice = derived().fold_ptr(node.slice),
            .suffix = derived().fold_list(node.suffix),
        };
    }

    Or fold(const Or& node) { return Or{derived().fold_list(node.pats)}; }

    Error fold(const Error& node) { return Error{node.diagnostic}; }
};

// Folder that changes nothing: a deep copy.
class PatternCloner : public PatternFolder<PatternCloner> {};

// Drops every AscribeUserType node, keeping its subpattern in place.
class AscriptionEraser : public PatternFolder<AscriptionEraser> {
public:
    Pat fold_pattern(const Pat& pat) {
        if (auto ascribe = pat.as<AscribeUserType>()) {
            return fold_pattern(*ascribe->subpattern);
        }
        return super_fold_pattern(pat);
    }
};

inline Pat clone_pattern(const Pat& pat) {
    return PatternCloner{}.fold_pattern(pat);
}

inline Pat erase_ascriptions(const Pat& pat) {
    return AscriptionEraser{}.fold_pattern(pat);
}

} // namespace thir
