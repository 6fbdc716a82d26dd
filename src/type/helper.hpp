#pragma once

#include "type/type.hpp"

#include <bit>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <variant>

namespace type {
namespace helper {

inline std::optional<PrimitiveKind> primitive_kind(const TypeContext& ctx, TypeId ty) {
    if (ty == invalid_type_id) {
        return std::nullopt;
    }
    if (auto kind = std::get_if<PrimitiveKind>(&ctx.get_type(ty).value)) {
        return *kind;
    }
    return std::nullopt;
}

inline bool is_signed_int(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::I8:
        case PrimitiveKind::I16:
        case PrimitiveKind::I32:
        case PrimitiveKind::I64:
        case PrimitiveKind::ISIZE:
            return true;
        default:
            return false;
    }
}

inline bool is_unsigned_int(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::U8:
        case PrimitiveKind::U16:
        case PrimitiveKind::U32:
        case PrimitiveKind::U64:
        case PrimitiveKind::USIZE:
            return true;
        default:
            return false;
    }
}

inline bool is_integer(PrimitiveKind kind) { return is_signed_int(kind) || is_unsigned_int(kind); }

inline bool is_float(PrimitiveKind kind) { return kind == PrimitiveKind::F32 || kind == PrimitiveKind::F64; }

// Size in bits of a scalar primitive. Pointer-sized integers are 64 bits wide.
inline unsigned bit_width(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::I8:
        case PrimitiveKind::U8:
        case PrimitiveKind::BOOL:
            return 8;
        case PrimitiveKind::I16:
        case PrimitiveKind::U16:
            return 16;
        case PrimitiveKind::I32:
        case PrimitiveKind::U32:
        case PrimitiveKind::F32:
        case PrimitiveKind::CHAR:
            return 32;
        case PrimitiveKind::I64:
        case PrimitiveKind::U64:
        case PrimitiveKind::ISIZE:
        case PrimitiveKind::USIZE:
        case PrimitiveKind::F64:
            return 64;
        case PrimitiveKind::STR:
            break;
    }
    throw std::logic_error("bit_width: str is not a scalar type");
}

inline uint64_t truncate(uint64_t bits, unsigned width) {
    if (width >= 64) {
        return bits;
    }
    return bits & ((uint64_t{1} << width) - 1);
}

inline int64_t sign_extend(uint64_t bits, unsigned width) {
    if (width >= 64) {
        return static_cast<int64_t>(bits);
    }
    const unsigned shift = 64 - width;
    return static_cast<int64_t>(bits << shift) >> shift;
}

inline int64_t signed_int_min(PrimitiveKind kind) {
    const unsigned width = bit_width(kind);
    return width >= 64 ? std::numeric_limits<int64_t>::min() : -(int64_t{1} << (width - 1));
}

inline int64_t signed_int_max(PrimitiveKind kind) {
    const unsigned width = bit_width(kind);
    return width >= 64 ? std::numeric_limits<int64_t>::max() : (int64_t{1} << (width - 1)) - 1;
}

inline uint64_t unsigned_int_max(PrimitiveKind kind) {
    return truncate(std::numeric_limits<uint64_t>::max(), bit_width(kind));
}

inline constexpr uint64_t kCharMax = 0x10FFFF;

// Bit pattern of the smallest value of a numeric type (ints, char, floats).
inline std::optional<uint64_t> numeric_min_bits(PrimitiveKind kind) {
    if (is_signed_int(kind)) {
        return truncate(static_cast<uint64_t>(signed_int_min(kind)), bit_width(kind));
    }
    if (is_unsigned_int(kind) || kind == PrimitiveKind::CHAR) {
        return uint64_t{0};
    }
    if (kind == PrimitiveKind::F32) {
        return std::bit_cast<uint32_t>(-std::numeric_limits<float>::infinity());
    }
    if (kind == PrimitiveKind::F64) {
        return std::bit_cast<uint64_t>(-std::numeric_limits<double>::infinity());
    }
    return std::nullopt;
}

inline std::optional<uint64_t> numeric_max_bits(PrimitiveKind kind) {
    if (is_signed_int(kind)) {
        return static_cast<uint64_t>(signed_int_max(kind));
    }
    if (is_unsigned_int(kind)) {
        return unsigned_int_max(kind);
    }
    if (kind == PrimitiveKind::CHAR) {
        return kCharMax;
    }
    if (kind == PrimitiveKind::F32) {
        return std::bit_cast<uint32_t>(std::numeric_limits<float>::infinity());
    }
    if (kind == PrimitiveKind::F64) {
        return std::bit_cast<uint64_t>(std::numeric_limits<double>::infinity());
    }
    return std::nullopt;
}

inline bool is_error(const TypeContext& ctx, TypeId ty) {
    return std::holds_alternative<ErrorType>(ctx.get_type(ty).value);
}

inline const AdtType* as_adt(const TypeContext& ctx, TypeId ty) {
    return std::get_if<AdtType>(&ctx.get_type(ty).value);
}

inline const ReferenceType* as_reference(const TypeContext& ctx, TypeId ty) {
    return std::get_if<ReferenceType>(&ctx.get_type(ty).value);
}

inline const TupleType* as_tuple(const TypeContext& ctx, TypeId ty) {
    return std::get_if<TupleType>(&ctx.get_type(ty).value);
}

} // namespace helper
} // namespace type
