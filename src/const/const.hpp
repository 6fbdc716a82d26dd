#pragma once
// file const.hpp
// constant values as seen by pattern lowering: structured valtrees, opaque
// evaluated values and not-yet-evaluated constant references

#include "type/type.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace const_eval {

using type::DefId;
using type::GenericArgs;
using type::TypeId;

// Raw bits of a scalar plus its size in bytes.
struct ScalarInt {
    uint64_t bits = 0;
    uint8_t size = 0;

    bool operator==(const ScalarInt&) const = default;
};

// Fully decomposed constant: scalars at the leaves, aggregates as branches.
// Enum values store the variant index as their first leaf.
struct ValTree {
    using Branch = std::vector<ValTree>;

    std::variant<ScalarInt, Branch> value;

    static ValTree leaf(uint64_t bits, uint8_t size) { return ValTree{ScalarInt{bits, size}}; }
    static ValTree branch(Branch children) { return ValTree{std::move(children)}; }

    bool is_leaf() const { return std::holds_alternative<ScalarInt>(value); }
    const ScalarInt* as_leaf() const { return std::get_if<ScalarInt>(&value); }
    const Branch* as_branch() const { return std::get_if<Branch>(&value); }

    bool operator==(const ValTree& other) const { return value == other.value; }
};

struct ZeroSized {
    bool operator==(const ZeroSized&) const = default;
};

// Bytes of an aggregate the evaluator could not express as a valtree.
struct IndirectValue {
    std::vector<uint8_t> bytes;

    bool operator==(const IndirectValue&) const = default;
};

// An evaluated constant without structure.
using ConstValue = std::variant<ScalarInt, ZeroSized, IndirectValue>;

struct UnevaluatedConst {
    DefId def = type::invalid_def_id;
    GenericArgs args;

    bool operator==(const UnevaluatedConst&) const = default;
};

// A type-level constant: either already a valtree or still unevaluated.
struct TyConst {
    std::variant<ValTree, UnevaluatedConst> kind;

    bool operator==(const TyConst& other) const { return kind == other.kind; }
};

struct Const {
    TypeId ty = type::invalid_type_id;
    std::variant<TyConst, ConstValue> value;

    static Const from_valtree(TypeId ty, ValTree tree) { return Const{ty, TyConst{std::move(tree)}}; }
    static Const from_value(TypeId ty, ConstValue val) { return Const{ty, std::move(val)}; }
    static Const from_bits(TypeId ty, uint64_t bits, uint8_t size) {
        return from_valtree(ty, ValTree::leaf(bits, size));
    }
    static Const unevaluated(TypeId ty, UnevaluatedConst uneval) { return Const{ty, TyConst{std::move(uneval)}}; }

    const ValTree* as_valtree() const {
        if (auto ty_const = std::get_if<TyConst>(&value)) {
            return std::get_if<ValTree>(&ty_const->kind);
        }
        return nullptr;
    }

    bool operator==(const Const& other) const { return ty == other.ty && value == other.value; }
};

struct Instance {
    DefId def = type::invalid_def_id;
    GenericArgs args;

    bool operator==(const Instance&) const = default;
};

} // namespace const_eval
