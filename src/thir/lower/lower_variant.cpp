#include "thir/lower/lower_internal.hpp"

#include "type/helper.hpp"
#include "utils/debug_context.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace thir::detail {

namespace {

bool is_leaf_res(const hir::Res& res) {
    switch (res.kind) {
        case hir::Res::Kind::SelfTyParam:
        case hir::Res::Kind::SelfTyAlias:
        case hir::Res::Kind::SelfCtor:
            return true;
        case hir::Res::Kind::Def:
            break;
        case hir::Res::Kind::Local:
        case hir::Res::Kind::Err:
            return false;
    }
    switch (res.def_kind) {
        case type::DefKind::Struct:
        case type::DefKind::StructCtor:
        case type::DefKind::Union:
        case type::DefKind::TyAlias:
        case type::DefKind::AssocTy:
            return true;
        default:
            return false;
    }
}

} // namespace

const type::VariantInfo& PatternLowerer::variant_of_res(type::AdtId adt, const hir::Res& res) const {
    const auto& info = ctx.types.get_adt(adt);
    if (res.is_def(type::DefKind::Variant)) {
        return info.variants.at(ctx.types.variant_index_with_id(adt, res.def_id));
    }
    if (res.is_def(type::DefKind::VariantCtor)) {
        return info.variants.at(ctx.types.variant_index_with_ctor_id(adt, res.def_id));
    }
    if (is_leaf_res(res) && !info.is_enum()) {
        return info.variants.front();
    }
    throw std::logic_error(debug::format_with_context(
        "path does not name a variant of '" + info.name + "'"));
}

PatKind PatternLowerer::lower_variant_or_leaf(hir::Res res, hir::HirId id, span::Span span, TypeId ty,
                                              std::vector<FieldPat> subpatterns) {
    // A tuple-like variant is named through its constructor.
    if (res.is_def(type::DefKind::VariantCtor)) {
        res = hir::Res::def(type::DefKind::Variant, ctx.types.parent(res.def_id));
    }

    PatKind kind = Wild{};
    if (res.is_def(type::DefKind::Variant)) {
        const type::DefId enum_id = ctx.types.parent(res.def_id);
        const auto adt = ctx.types.adt_of_def(enum_id);
        if (!adt) {
            throw std::logic_error(debug::format_with_context(
                "variant '" + ctx.types.def(res.def_id).name + "' has no enclosing ADT"));
        }
        const auto& adt_info = ctx.types.get_adt(*adt);
        if (adt_info.is_enum() && adt_info.variants.size() > 1) {
            const auto& scrutinee = ctx.types.get_type(ty).value;
            if (auto error_ty = std::get_if<type::ErrorType>(&scrutinee)) {
                return Error{error_ty->reported};
            }
            const auto* adt_ty = std::get_if<type::AdtType>(&scrutinee);
            if (!adt_ty) {
                throw std::logic_error(debug::format_with_context(
                    "enum variant pattern has non-ADT type " + ctx.types.to_string(ty)));
            }
            const size_t variant_index = ctx.types.variant_index_with_id(*adt, res.def_id);
            trace("variant " + adt_info.name + "::" + adt_info.variants[variant_index].name);
            kind = Variant{
                .adt = *adt,
                .args = adt_ty->args,
                .variant_index = variant_index,
                .subpatterns = std::move(subpatterns),
            };
        } else {
            trace("single-variant " + adt_info.name + " is a leaf");
            kind = Leaf{std::move(subpatterns)};
        }
    } else if (is_leaf_res(res)) {
        trace("leaf " + ctx.types.to_string(ty));
        kind = Leaf{std::move(subpatterns)};
    } else if (res.is_def(type::DefKind::ConstParam)) {
        kind = Error{error(ErrorKind::ConstGenericParameterInPattern,
                           "const parameters cannot be referenced in patterns", span)};
    } else if (res.is_def(type::DefKind::Static)) {
        kind = Error{error(ErrorKind::StaticInPattern,
                           "statics cannot be referenced in patterns", span,
                           {"use a constant or a binding with a guard instead"})};
    } else {
        kind = Error{error(ErrorKind::NonConstantPath,
                           "path in pattern does not refer to a constant, struct or enum variant", span)};
    }

    if (const auto* user_ty = ctx.typeck.user_provided_type(id)) {
        kind = AscribeUserType{
            .ascription = Ascription{
                .annotation = CanonicalUserTypeAnnotation{
                    .user_ty = *user_ty,
                    .span = span,
                    .inferred_ty = ctx.typeck.node_type(id),
                },
                .variance = Variance::Covariant,
            },
            .subpattern = make_pat(ty, span, std::move(kind)),
        };
    }
    return kind;
}

} // namespace thir::detail
