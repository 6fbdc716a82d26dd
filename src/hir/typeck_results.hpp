#pragma once

#include "hir/hir.hpp"
#include "type/type.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hir {

// How a binding captures the scrutinee, as decided by type checking.
struct BindingMode {
    bool by_ref = false;
    Mutability mutability = Mutability::Not;

    static BindingMode by_value(Mutability m) { return BindingMode{false, m}; }
    static BindingMode by_reference(Mutability m) { return BindingMode{true, m}; }
};

// A type the user wrote, either directly (`Ty`) or as the type of a path with
// explicit generic arguments (`TypeOf`).
struct UserType {
    enum class Kind { Ty, TypeOf };

    Kind kind = Kind::Ty;
    type::TypeId ty = type::invalid_type_id;
    type::DefId def_id = type::invalid_def_id;
    type::GenericArgs args;

    bool operator==(const UserType&) const = default;
};

/**
 * @brief Per-node results of type checking, keyed by HirId.
 *
 * Filled by the type checker (or a test) and then only read during pattern
 * lowering.
 */
class TypeckResults {
public:
    void set_node_type(HirId id, type::TypeId ty) { node_types_[id] = ty; }
    void set_pat_adjustments(HirId id, std::vector<type::TypeId> adjustments) {
        pat_adjustments_[id] = std::move(adjustments);
    }
    void set_binding_mode(HirId id, BindingMode mode) { binding_modes_[id] = mode; }
    void set_user_provided_type(HirId id, UserType user_ty) { user_types_[id] = std::move(user_ty); }
    void set_field_index(HirId id, size_t index) { field_indices_[id] = index; }
    void set_qpath_res(HirId id, Res res) { resolutions_[id] = res; }
    void set_node_args(HirId id, type::GenericArgs args) { node_args_[id] = std::move(args); }

    type::TypeId node_type(HirId id) const {
        auto it = node_types_.find(id);
        if (it == node_types_.end()) {
            throw std::logic_error("node_type: no type recorded for hir#" + std::to_string(id));
        }
        return it->second;
    }

    type::TypeId expr_ty(const Expr& expr) const { return node_type(expr.hir_id); }

    // Implicit dereferences inserted before matching, outermost first.
    const std::vector<type::TypeId>* pat_adjustments(HirId id) const {
        auto it = pat_adjustments_.find(id);
        return it != pat_adjustments_.end() ? &it->second : nullptr;
    }

    std::optional<BindingMode> binding_mode(HirId id) const {
        auto it = binding_modes_.find(id);
        if (it != binding_modes_.end()) return it->second;
        return std::nullopt;
    }

    const UserType* user_provided_type(HirId id) const {
        auto it = user_types_.find(id);
        return it != user_types_.end() ? &it->second : nullptr;
    }

    size_t field_index(HirId id) const {
        auto it = field_indices_.find(id);
        if (it == field_indices_.end()) {
            throw std::logic_error("field_index: no field index recorded for hir#" + std::to_string(id));
        }
        return it->second;
    }

    Res qpath_res(HirId id) const {
        auto it = resolutions_.find(id);
        return it != resolutions_.end() ? it->second : Res::err();
    }

    type::GenericArgs node_args(HirId id) const {
        auto it = node_args_.find(id);
        return it != node_args_.end() ? it->second : type::GenericArgs{};
    }

private:
    std::unordered_map<HirId, type::TypeId> node_types_;
    std::unordered_map<HirId, std::vector<type::TypeId>> pat_adjustments_;
    std::unordered_map<HirId, BindingMode> binding_modes_;
    std::unordered_map<HirId, UserType> user_types_;
    std::unordered_map<HirId, size_t> field_indices_;
    std::unordered_map<HirId, Res> resolutions_;
    std::unordered_map<HirId, type::GenericArgs> node_args_;
};

} // namespace hir
