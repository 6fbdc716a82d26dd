#include "const/lit_to_const.hpp"

#include "type/helper.hpp"
#include "utils/helpers.hpp"

#include <bit>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace const_eval {

namespace {

LitToConstError type_error() {
    return LitToConstError{.kind = LitToConstError::Kind::TypeError, .diagnostic = {}};
}

LitToConstError reported(std::string message, span::Span span) {
    return LitToConstError{
        .kind = LitToConstError::Kind::Reported,
        .diagnostic = Diagnostic{
            .kind = ErrorKind::LiteralConversionFailed,
            .message = std::move(message),
            .span = span,
            .notes = {},
        },
    };
}

uint8_t byte_size(type::PrimitiveKind kind) {
    return static_cast<uint8_t>(type::helper::bit_width(kind) / 8);
}

std::optional<type::PrimitiveKind> referenced_primitive(type::TypeContext& types, TypeId ty) {
    if (auto ref = type::helper::as_reference(types, ty)) {
        return type::helper::primitive_kind(types, ref->referenced_type);
    }
    return std::nullopt;
}

} // namespace

LitToConstResult lit_to_const(type::TypeContext& types, const LitToConstInput& input) {
    if (!input.lit) {
        throw std::logic_error("lit_to_const: missing literal");
    }
    const hir::Literal& lit = *input.lit;
    const auto kind = type::helper::primitive_kind(types, input.ty);

    return std::visit(Overloaded{
        [&](const hir::Literal::Integer& integer) -> LitToConstResult {
            if (!kind || !type::helper::is_integer(*kind)) {
                return type_error();
            }
            const unsigned width = type::helper::bit_width(*kind);
            uint64_t bits = input.negated ? ~integer.value + 1 : integer.value;
            return Const::from_bits(input.ty, type::helper::truncate(bits, width), byte_size(*kind));
        },
        [&](const hir::Literal::Float& fl) -> LitToConstResult {
            if (!kind || !type::helper::is_float(*kind)) {
                return type_error();
            }
            const char* begin = fl.symbol.c_str();
            char* end = nullptr;
            errno = 0;
            if (*kind == type::PrimitiveKind::F32) {
                float value = std::strtof(begin, &end);
                if (end == begin || *end != '\0' || errno == ERANGE) {
                    return reported("could not evaluate float literal `" + fl.symbol + "`", lit.span);
                }
                value = input.negated ? -value : value;
                return Const::from_bits(input.ty, std::bit_cast<uint32_t>(value), 4);
            }
            double value = std::strtod(begin, &end);
            if (end == begin || *end != '\0' || errno == ERANGE) {
                return reported("could not evaluate float literal `" + fl.symbol + "`", lit.span);
            }
            value = input.negated ? -value : value;
            return Const::from_bits(input.ty, std::bit_cast<uint64_t>(value), 8);
        },
        [&](const bool& value) -> LitToConstResult {
            if (input.negated || !kind || *kind != type::PrimitiveKind::BOOL) {
                return type_error();
            }
            return Const::from_bits(input.ty, value ? 1 : 0, 1);
        },
        [&](const char32_t& value) -> LitToConstResult {
            if (input.negated || !kind || *kind != type::PrimitiveKind::CHAR) {
                return type_error();
            }
            return Const::from_bits(input.ty, static_cast<uint64_t>(value), 4);
        },
        [&](const hir::Literal::String& str) -> LitToConstResult {
            auto pointee = referenced_primitive(types, input.ty);
            if (input.negated || !pointee || *pointee != type::PrimitiveKind::STR) {
                return type_error();
            }
            ValTree::Branch bytes;
            bytes.reserve(str.value.size());
            for (unsigned char c : str.value) {
                bytes.push_back(ValTree::leaf(c, 1));
            }
            return Const::from_valtree(input.ty, ValTree::branch(std::move(bytes)));
        },
    }, lit.value);
}

} // namespace const_eval
