#include "type/type.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "utils/helpers.hpp"

namespace type {

TypeId TypeContext::get_id(const Type& t) {
    auto it = registered_types.find(t);
    if (it != registered_types.end()) {
        return it->second;
    }

    if (types.size() >= static_cast<size_t>(invalid_type_id)) {
        throw std::overflow_error("TypeId overflow");
    }

    TypeId id = static_cast<TypeId>(types.size());
    types.push_back(t);
    registered_types.emplace(types.back(), id);
    return id;
}

const Type& TypeContext::get_type(TypeId id) const {
    if (id == invalid_type_id) {
        throw std::out_of_range("Attempted to access invalid TypeId");
    }
    return types.at(id);
}

DefId TypeContext::register_def(DefKind kind, std::string name, DefId parent) {
    DefId id = static_cast<DefId>(defs.size());
    defs.push_back(DefInfo{.kind = kind, .name = std::move(name), .parent = parent});
    return id;
}

DefId TypeContext::parent(DefId id) const {
    DefId parent_id = def(id).parent;
    if (parent_id == invalid_def_id) {
        throw std::logic_error("Definition '" + def(id).name + "' has no parent");
    }
    return parent_id;
}

AdtId TypeContext::register_adt(std::string name, AdtKind kind, std::vector<VariantInfo> variants,
                                size_t generic_count) {
    if (kind != AdtKind::Enum && variants.size() != 1) {
        throw std::logic_error("Struct or union '" + name + "' must have exactly one variant");
    }
    DefKind adt_kind = kind == AdtKind::Enum ? DefKind::Enum
                     : kind == AdtKind::Union ? DefKind::Union
                                              : DefKind::Struct;
    DefId adt_def = register_def(adt_kind, name);

    for (auto& variant : variants) {
        if (kind == AdtKind::Enum) {
            variant.def_id = register_def(DefKind::Variant, name + "::" + variant.name, adt_def);
            if (variant.has_ctor) {
                variant.ctor_id = register_def(DefKind::VariantCtor, name + "::" + variant.name, variant.def_id);
            }
        } else {
            // A struct's only variant shares the struct's own definition.
            variant.def_id = adt_def;
            if (variant.has_ctor && kind == AdtKind::Struct) {
                variant.ctor_id = register_def(DefKind::StructCtor, name, adt_def);
            }
        }
    }

    AdtId id = static_cast<AdtId>(adts.size());
    adts.push_back(AdtInfo{
        .name = std::move(name),
        .kind = kind,
        .variants = std::move(variants),
        .generic_count = generic_count,
        .def_id = adt_def,
    });
    adt_ids.emplace(adt_def, id);
    return id;
}

std::optional<AdtId> TypeContext::adt_of_def(DefId def_id) const {
    auto it = adt_ids.find(def_id);
    if (it != adt_ids.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t TypeContext::variant_index_with_id(AdtId adt, DefId variant_id) const {
    const auto& info = get_adt(adt);
    for (size_t i = 0; i < info.variants.size(); ++i) {
        if (info.variants[i].def_id == variant_id) {
            return i;
        }
    }
    throw std::logic_error("variant_index_with_id: unknown variant of '" + info.name + "'");
}

size_t TypeContext::variant_index_with_ctor_id(AdtId adt, DefId ctor_id) const {
    const auto& info = get_adt(adt);
    for (size_t i = 0; i < info.variants.size(); ++i) {
        if (info.variants[i].ctor_id == ctor_id) {
            return i;
        }
    }
    throw std::logic_error("variant_index_with_ctor_id: unknown ctor of '" + info.name + "'");
}

TypeId TypeContext::substitute(TypeId ty, const GenericArgs& args) {
    if (args.empty() || ty == invalid_type_id) {
        return ty;
    }
    // Copy: interning below may grow `types`.
    Type copy = get_type(ty);
    return std::visit(Overloaded{
        [&](const ParamType& param) -> TypeId {
            return param.index < args.size() ? args[param.index] : ty;
        },
        [&](const AdtType& adt) -> TypeId {
            GenericArgs substituted;
            substituted.reserve(adt.args.size());
            for (TypeId arg : adt.args) {
                substituted.push_back(substitute(arg, args));
            }
            return this->adt(adt.id, std::move(substituted));
        },
        [&](const ReferenceType& ref) -> TypeId {
            return reference(substitute(ref.referenced_type, args), ref.is_mutable);
        },
        [&](const BoxType& boxed) -> TypeId { return box(substitute(boxed.boxed_type, args)); },
        [&](const ArrayType& arr) -> TypeId { return array(substitute(arr.element_type, args), arr.size); },
        [&](const SliceType& sl) -> TypeId { return slice(substitute(sl.element_type, args)); },
        [&](const TupleType& tup) -> TypeId {
            std::vector<TypeId> elements;
            elements.reserve(tup.elements.size());
            for (TypeId element : tup.elements) {
                elements.push_back(substitute(element, args));
            }
            return tuple(std::move(elements));
        },
        [&](const auto&) -> TypeId { return ty; },
    }, copy.value);
}

TypeId TypeContext::field_type(AdtId adt, size_t variant_index, size_t field_index, const GenericArgs& args) {
    TypeId declared = get_adt(adt).variants.at(variant_index).fields.at(field_index).type;
    return substitute(declared, args);
}

namespace {

const char* primitive_name(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::I8: return "i8";
        case PrimitiveKind::I16: return "i16";
        case PrimitiveKind::I32: return "i32";
        case PrimitiveKind::I64: return "i64";
        case PrimitiveKind::ISIZE: return "isize";
        case PrimitiveKind::U8: return "u8";
        case PrimitiveKind::U16: return "u16";
        case PrimitiveKind::U32: return "u32";
        case PrimitiveKind::U64: return "u64";
        case PrimitiveKind::USIZE: return "usize";
        case PrimitiveKind::F32: return "f32";
        case PrimitiveKind::F64: return "f64";
        case PrimitiveKind::BOOL: return "bool";
        case PrimitiveKind::CHAR: return "char";
        case PrimitiveKind::STR: return "str";
    }
    return "<prim>";
}

} // namespace

std::string TypeContext::to_string(TypeId id) const {
    if (id == invalid_type_id) {
        return "<invalid>";
    }
    std::ostringstream oss;
    std::visit(Overloaded{
        [&](PrimitiveKind kind) { oss << primitive_name(kind); },
        [&](const AdtType& adt) {
            oss << get_adt(adt.id).name;
            if (!adt.args.empty()) {
                oss << "<";
                for (size_t i = 0; i < adt.args.size(); ++i) {
                    oss << (i ? ", " : "") << to_string(adt.args[i]);
                }
                oss << ">";
            }
        },
        [&](const ReferenceType& ref) {
            oss << "&" << (ref.is_mutable ? "mut " : "") << to_string(ref.referenced_type);
        },
        [&](const BoxType& boxed) { oss << "Box<" << to_string(boxed.boxed_type) << ">"; },
        [&](const ArrayType& arr) { oss << "[" << to_string(arr.element_type) << "; " << arr.size << "]"; },
        [&](const SliceType& sl) { oss << "[" << to_string(sl.element_type) << "]"; },
        [&](const TupleType& tup) {
            oss << "(";
            for (size_t i = 0; i < tup.elements.size(); ++i) {
                oss << (i ? ", " : "") << to_string(tup.elements[i]);
            }
            if (tup.elements.size() == 1) {
                oss << ",";
            }
            oss << ")";
        },
        [&](const ParamType& param) { oss << param.name; },
        [&](const NeverType&) { oss << "!"; },
        [&](const ErrorType&) { oss << "{type error}"; },
    }, get_type(id).value);
    return oss.str();
}

} // namespace type
