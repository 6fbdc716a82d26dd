#include "thir/pretty_print.hpp"

#include "type/helper.hpp"
#include "utils/helpers.hpp"

#include <bit>
#include <iomanip>
#include <sstream>

namespace thir {

namespace {

const char* variance_name(Variance variance) {
    switch (variance) {
        case Variance::Covariant: return "+";
        case Variance::Contravariant: return "-";
        case Variance::Invariant: return "=";
    }
    return "?";
}

} // namespace

void PatternPrinter::print(const Pat& pat) {
    std::visit(Overloaded{
        [&](const Wild&) { out_ << "_"; },
        [&](const AscribeUserType& node) {
            out_ << "(";
            print(*node.subpattern);
            const auto& user_ty = node.ascription.annotation.user_ty;
            out_ << " : " << variance_name(node.ascription.variance);
            if (user_ty.kind == hir::UserType::Kind::TypeOf) {
                out_ << "typeof(" << types_.def(user_ty.def_id).name << ")";
            } else {
                out_ << types_.to_string(user_ty.ty);
            }
            out_ << ")";
        },
        [&](const Binding& node) {
            if (node.mode.kind == BindingMode::Kind::ByRef) {
                out_ << (node.mode.borrow == BorrowKind::Mut ? "ref mut " : "ref ");
            } else if (node.mutability == hir::Mutability::Mut) {
                out_ << "mut ";
            }
            out_ << node.name;
            if (node.subpattern) {
                out_ << " @ ";
                print(*node.subpattern);
            }
        },
        [&](const Variant& node) {
            const auto& adt = types_.get_adt(node.adt);
            out_ << adt.name << "::" << adt.variants.at(node.variant_index).name;
            print_fields(node.subpatterns);
        },
        [&](const Leaf& node) {
            out_ << types_.to_string(pat.ty);
            print_fields(node.subpatterns);
        },
        [&](const Deref& node) {
            if (auto ref = type::helper::as_reference(types_, pat.ty)) {
                out_ << (ref->is_mutable ? "&mut " : "&");
            } else if (std::holds_alternative<type::BoxType>(types_.get_type(pat.ty).value)) {
                out_ << "box ";
            } else {
                out_ << "*";
            }
            print(*node.subpattern);
        },
        [&](const Constant& node) { print_const(node.value); },
        [&](const Range& node) {
            print_const(node.lo);
            out_ << (node.end == hir::RangeEnd::Included ? "..=" : "..");
            print_const(node.hi);
        },
        [&](const Slice& node) { print_sequence(node.prefix, node.slice, node.suffix); },
        [&](const Array& node) { print_sequence(node.prefix, node.slice, node.suffix); },
        [&](const Or& node) {
            for (size_t i = 0; i < node.pats.size(); ++i) {
                if (i > 0) {
                    out_ << " | ";
                }
                print(*node.pats[i]);
            }
        },
        [&](const Error& node) { out_ << "<error #" << node.diagnostic.index << ">"; },
    }, pat.kind);
}

void PatternPrinter::print_fields(const std::vector<FieldPat>& fields) {
    if (fields.empty()) {
        return;
    }
    out_ << "(";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out_ << ", ";
        }
        out_ << fields[i].field << ": ";
        print(*fields[i].pattern);
    }
    out_ << ")";
}

void PatternPrinter::print_sequence(const std::vector<PatPtr>& prefix, const PatPtr& slice,
                                    const std::vector<PatPtr>& suffix) {
    out_ << "[";
    bool first = true;
    auto separator = [&]() {
        if (!first) {
            out_ << ", ";
        }
        first = false;
    };
    for (const auto& pat : prefix) {
        separator();
        print(*pat);
    }
    if (slice) {
        separator();
        print(*slice);
        out_ << " @ ..";
    }
    for (const auto& pat : suffix) {
        separator();
        print(*pat);
    }
    out_ << "]";
}

void PatternPrinter::print_const(const const_eval::Const& value) {
    std::visit(Overloaded{
        [&](const const_eval::TyConst& ty_const) {
            std::visit(Overloaded{
                [&](const const_eval::ValTree& tree) {
                    if (auto leaf = tree.as_leaf()) {
                        print_scalar(value.ty, *leaf);
                    } else {
                        print_valtree(tree);
                    }
                },
                [&](const const_eval::UnevaluatedConst& uneval) {
                    out_ << "const#" << uneval.def;
                },
            }, ty_const.kind);
        },
        [&](const const_eval::ConstValue& opaque) {
            std::visit(Overloaded{
                [&](const const_eval::ScalarInt& scalar) { print_scalar(value.ty, scalar); },
                [&](const const_eval::ZeroSized&) { out_ << "<zst>"; },
                [&](const const_eval::IndirectValue& indirect) {
                    out_ << "<opaque " << indirect.bytes.size() << " bytes>";
                },
            }, opaque);
        },
    }, value.value);
}

void PatternPrinter::print_valtree(const const_eval::ValTree& tree) {
    if (auto leaf = tree.as_leaf()) {
        out_ << leaf->bits;
        return;
    }
    out_ << "{";
    const auto& children = *tree.as_branch();
    for (size_t i = 0; i < children.size(); ++i) {
        if (i > 0) {
            out_ << ", ";
        }
        print_valtree(children[i]);
    }
    out_ << "}";
}

void PatternPrinter::print_scalar(type::TypeId ty, const const_eval::ScalarInt& scalar) {
    auto kind = type::helper::primitive_kind(types_, ty);
    if (!kind) {
        out_ << "0x" << std::hex << scalar.bits << std::dec;
        return;
    }
    switch (*kind) {
        case type::PrimitiveKind::BOOL:
            out_ << (scalar.bits != 0 ? "true" : "false");
            return;
        case type::PrimitiveKind::CHAR:
            if (scalar.bits >= 0x20 && scalar.bits < 0x7F) {
                out_ << "'" << static_cast<char>(scalar.bits) << "'";
            } else {
                out_ << "'\\u{" << std::hex << scalar.bits << std::dec << "}'";
            }
            return;
        case type::PrimitiveKind::F32:
            out_ << std::bit_cast<float>(static_cast<uint32_t>(scalar.bits)) << "f32";
            return;
        case type::PrimitiveKind::F64:
            out_ << std::bit_cast<double>(scalar.bits) << "f64";
            return;
        default:
            break;
    }
    if (type::helper::is_signed_int(*kind)) {
        out_ << type::helper::sign_extend(scalar.bits, type::helper::bit_width(*kind));
    } else {
        out_ << scalar.bits;
    }
    out_ << types_.to_string(ty);
}

std::string to_string(const type::TypeContext& types, const Pat& pat) {
    std::ostringstream oss;
    PatternPrinter(oss, types).print(pat);
    return oss.str();
}

std::string to_string(const type::TypeContext& types, const const_eval::Const& value) {
    std::ostringstream oss;
    PatternPrinter(oss, types).print_const(value);
    return oss.str();
}

} // namespace thir
