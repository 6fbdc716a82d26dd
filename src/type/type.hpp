#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "utils/error.hpp"

namespace type {

struct Type;

using TypeId = std::uint32_t;
inline constexpr TypeId invalid_type_id = std::numeric_limits<TypeId>::max();

using AdtId = std::uint32_t;
using DefId = std::uint32_t;
inline constexpr DefId invalid_def_id = std::numeric_limits<DefId>::max();

using GenericArgs = std::vector<TypeId>;

enum class PrimitiveKind {
    I8,
    I16,
    I32,
    I64,
    ISIZE,
    U8,
    U16,
    U32,
    U64,
    USIZE,
    F32,
    F64,
    BOOL,
    CHAR,
    STR,
};

struct AdtType {
    AdtId id;
    GenericArgs args;

    bool operator==(const AdtType& other) const { return id == other.id && args == other.args; }
};

struct ReferenceType {
    TypeId referenced_type = invalid_type_id;
    bool is_mutable = false;

    bool operator==(const ReferenceType& other) const {
        return referenced_type == other.referenced_type && is_mutable == other.is_mutable;
    }
};

struct BoxType {
    TypeId boxed_type = invalid_type_id;

    bool operator==(const BoxType& other) const { return boxed_type == other.boxed_type; }
};

struct ArrayType {
    TypeId element_type = invalid_type_id;
    size_t size = 0;

    bool operator==(const ArrayType& other) const {
        return element_type == other.element_type && size == other.size;
    }
};

struct SliceType {
    TypeId element_type = invalid_type_id;

    bool operator==(const SliceType& other) const { return element_type == other.element_type; }
};

// The unit type is the empty tuple.
struct TupleType {
    std::vector<TypeId> elements;

    bool operator==(const TupleType& other) const { return elements == other.elements; }
};

// A generic parameter of the enclosing item, by position.
struct ParamType {
    std::uint32_t index = 0;
    std::string name;

    bool operator==(const ParamType& other) const { return index == other.index; }
};

struct NeverType {
    bool operator==(const NeverType&) const { return true; }
};

// A type that already failed to check; the failure has been reported.
struct ErrorType {
    DiagnosticId reported;

    bool operator==(const ErrorType& other) const { return reported == other.reported; }
};

using TypeVariant = std::variant<
    PrimitiveKind,
    AdtType,
    ReferenceType,
    BoxType,
    ArrayType,
    SliceType,
    TupleType,
    ParamType,
    NeverType,
    ErrorType
>;

struct Type {
    TypeVariant value;

    bool operator==(const Type& other) const { return value == other.value; }
};

struct TypeHash {
    static size_t combine(size_t seed, size_t value) {
        return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
    }

    size_t operator()(const PrimitiveKind& pk) const { return std::hash<int>()(static_cast<int>(pk)); }
    size_t operator()(const AdtType& adt) const {
        size_t seed = std::hash<AdtId>()(adt.id);
        for (TypeId arg : adt.args) {
            seed = combine(seed, std::hash<TypeId>()(arg));
        }
        return seed;
    }
    size_t operator()(const ReferenceType& rt) const {
        return std::hash<TypeId>()(rt.referenced_type) ^ (std::hash<bool>()(rt.is_mutable) << 1);
    }
    size_t operator()(const BoxType& bt) const { return combine(0xB0, std::hash<TypeId>()(bt.boxed_type)); }
    size_t operator()(const ArrayType& at) const {
        return std::hash<TypeId>()(at.element_type) ^ (std::hash<size_t>()(at.size) << 1);
    }
    size_t operator()(const SliceType& st) const { return combine(0x51, std::hash<TypeId>()(st.element_type)); }
    size_t operator()(const TupleType& tt) const {
        size_t seed = 0x7u;
        for (TypeId element : tt.elements) {
            seed = combine(seed, std::hash<TypeId>()(element));
        }
        return seed;
    }
    size_t operator()(const ParamType& pt) const { return combine(0xA7, std::hash<std::uint32_t>()(pt.index)); }
    size_t operator()(const NeverType&) const { return 0xDABCABCD; }
    size_t operator()(const ErrorType& et) const { return combine(0xDABCABCE, et.reported.index); }
    size_t operator()(const Type& t) const { return combine(t.value.index(), std::visit(*this, t.value)); }
};

// --- Definitions ---

enum class DefKind {
    Struct,
    Union,
    Enum,
    Variant,
    StructCtor,
    VariantCtor,
    TyAlias,
    AssocTy,
    Trait,
    Const,
    AssocConst,
    ConstParam,
    Static,
    Fn,
    InlineConst,
};

struct DefInfo {
    DefKind kind;
    std::string name;
    DefId parent = invalid_def_id;
};

enum class AdtKind { Struct, Enum, Union };

struct FieldInfo {
    std::string name;
    TypeId type = invalid_type_id;
};

struct VariantInfo {
    std::string name;
    std::vector<FieldInfo> fields;
    bool has_ctor = true;
    // Filled in at registration.
    DefId def_id = invalid_def_id;
    DefId ctor_id = invalid_def_id;
};

struct AdtInfo {
    std::string name;
    AdtKind kind = AdtKind::Struct;
    std::vector<VariantInfo> variants;
    size_t generic_count = 0;
    DefId def_id = invalid_def_id;

    bool is_enum() const { return kind == AdtKind::Enum; }
};

/**
 * @brief Interned types plus the definition tables patterns are resolved against.
 *
 * Owned by the caller and passed explicitly; lowering only reads from it once
 * the types it needs have been interned.
 */
class TypeContext {
public:
    TypeContext() = default;
    TypeContext(const TypeContext&) = delete;
    TypeContext& operator=(const TypeContext&) = delete;

    TypeId get_id(const Type& t);
    const Type& get_type(TypeId id) const;

    TypeId primitive(PrimitiveKind kind) { return get_id(Type{kind}); }
    TypeId reference(TypeId referenced, bool is_mutable = false) {
        return get_id(Type{ReferenceType{referenced, is_mutable}});
    }
    TypeId box(TypeId boxed) { return get_id(Type{BoxType{boxed}}); }
    TypeId array(TypeId element, size_t size) { return get_id(Type{ArrayType{element, size}}); }
    TypeId slice(TypeId element) { return get_id(Type{SliceType{element}}); }
    TypeId tuple(std::vector<TypeId> elements) { return get_id(Type{TupleType{std::move(elements)}}); }
    TypeId unit() { return tuple({}); }
    TypeId adt(AdtId id, GenericArgs args = {}) { return get_id(Type{AdtType{id, std::move(args)}}); }
    TypeId param(std::uint32_t index, std::string name) {
        return get_id(Type{ParamType{index, std::move(name)}});
    }
    TypeId error(DiagnosticId reported) { return get_id(Type{ErrorType{reported}}); }

    DefId register_def(DefKind kind, std::string name, DefId parent = invalid_def_id);
    const DefInfo& def(DefId id) const { return defs.at(id); }
    DefKind def_kind(DefId id) const { return def(id).kind; }
    DefId parent(DefId id) const;

    // Registers the ADT and assigns DefIds to it, its variants and their ctors.
    AdtId register_adt(std::string name, AdtKind kind, std::vector<VariantInfo> variants,
                       size_t generic_count = 0);
    const AdtInfo& get_adt(AdtId id) const { return adts.at(id); }
    std::optional<AdtId> adt_of_def(DefId def_id) const;
    size_t variant_index_with_id(AdtId adt, DefId variant_id) const;
    size_t variant_index_with_ctor_id(AdtId adt, DefId ctor_id) const;

    // Replaces ParamType occurrences with the matching entry of `args`.
    TypeId substitute(TypeId ty, const GenericArgs& args);
    TypeId field_type(AdtId adt, size_t variant_index, size_t field_index, const GenericArgs& args);

    std::string to_string(TypeId id) const;

private:
    std::unordered_map<Type, TypeId, TypeHash> registered_types;
    std::vector<Type> types;
    std::vector<DefInfo> defs;
    std::vector<AdtInfo> adts;
    std::unordered_map<DefId, AdtId> adt_ids;
};

} // namespace type
