#include "const/table_oracle.hpp"

#include "const/lit_to_const.hpp"

#include <stdexcept>

namespace const_eval {

namespace {

void flatten_into(const ValTree& tree, std::vector<uint8_t>& out) {
    if (auto leaf = tree.as_leaf()) {
        for (uint8_t i = 0; i < leaf->size; ++i) {
            out.push_back(static_cast<uint8_t>((leaf->bits >> (8 * i)) & 0xFF));
        }
        return;
    }
    for (const auto& child : *tree.as_branch()) {
        flatten_into(child, out);
    }
}

ConstValue to_const_value(const ValTree& tree) {
    if (auto leaf = tree.as_leaf()) {
        return *leaf;
    }
    if (tree.as_branch()->empty()) {
        return ZeroSized{};
    }
    IndirectValue indirect;
    flatten_into(tree, indirect.bytes);
    return indirect;
}

EvalError failure(std::string message) {
    return EvalError::reported(Diagnostic{
        .kind = ErrorKind::ConstantEvaluationFailed,
        .message = std::move(message),
        .span = span::Span::invalid(),
        .notes = {},
    });
}

} // namespace

void TableConstEvaluator::define_value(DefId def, ValTree value) {
    entries[def] = Entry{.outcome = Entry::Outcome::Value, .valtree = std::move(value), .opaque = ZeroSized{}, .failure_message = {}};
}

void TableConstEvaluator::define_opaque(DefId def, ConstValue value) {
    entries[def] = Entry{.outcome = Entry::Outcome::Opaque, .valtree = std::nullopt, .opaque = std::move(value), .failure_message = {}};
}

void TableConstEvaluator::define_too_generic(DefId def) {
    entries[def] = Entry{.outcome = Entry::Outcome::TooGeneric, .valtree = std::nullopt, .opaque = ZeroSized{}, .failure_message = {}};
}

void TableConstEvaluator::define_failure(DefId def, std::string message) {
    entries[def] = Entry{.outcome = Entry::Outcome::Failed, .valtree = std::nullopt, .opaque = ZeroSized{}, .failure_message = std::move(message)};
}

void TableConstEvaluator::declare_assoc_const(DefId trait_const) {
    assoc_consts.insert(trait_const);
}

void TableConstEvaluator::register_assoc_impl(DefId trait_const, type::TypeId self_ty, DefId impl_const) {
    assoc_consts.insert(trait_const);
    assoc_impls[{trait_const, self_ty}] = impl_const;
}

InstanceResolution TableConstEvaluator::resolve_instance(DefId def, const GenericArgs& args) {
    if (failing_resolutions.contains(def)) {
        return InstanceResolution{.status = InstanceResolution::Status::Failed, .instance = {}};
    }
    if (!assoc_consts.contains(def)) {
        return InstanceResolution{.status = InstanceResolution::Status::Resolved, .instance = Instance{def, args}};
    }
    if (args.empty()) {
        return InstanceResolution{.status = InstanceResolution::Status::NoInstance, .instance = {}};
    }
    auto it = assoc_impls.find({def, args.front()});
    if (it == assoc_impls.end()) {
        return InstanceResolution{.status = InstanceResolution::Status::NoInstance, .instance = {}};
    }
    return InstanceResolution{.status = InstanceResolution::Status::Resolved, .instance = Instance{it->second, args}};
}

const TableConstEvaluator::Entry* TableConstEvaluator::lookup(DefId def) const {
    auto it = entries.find(def);
    return it != entries.end() ? &it->second : nullptr;
}

EvalResult<std::optional<ValTree>> TableConstEvaluator::structured(DefId def) {
    ++evaluations;
    const Entry* entry = lookup(def);
    if (!entry) {
        return failure("constant has no known value");
    }
    switch (entry->outcome) {
        case Entry::Outcome::Value:
            return std::optional<ValTree>(*entry->valtree);
        case Entry::Outcome::Opaque:
            return std::optional<ValTree>(std::nullopt);
        case Entry::Outcome::TooGeneric:
            return EvalError::too_generic();
        case Entry::Outcome::Failed:
            return failure(entry->failure_message);
    }
    throw std::logic_error("TableConstEvaluator: unknown outcome");
}

EvalResult<ConstValue> TableConstEvaluator::opaque(DefId def) {
    ++evaluations;
    const Entry* entry = lookup(def);
    if (!entry) {
        return failure("constant has no known value");
    }
    switch (entry->outcome) {
        case Entry::Outcome::Value:
            return to_const_value(*entry->valtree);
        case Entry::Outcome::Opaque:
            return entry->opaque;
        case Entry::Outcome::TooGeneric:
            return EvalError::too_generic();
        case Entry::Outcome::Failed:
            return failure(entry->failure_message);
    }
    throw std::logic_error("TableConstEvaluator: unknown outcome");
}

EvalResult<std::optional<ValTree>> TableConstEvaluator::eval_global_for_typeck(const Instance& instance) {
    return structured(instance.def);
}

EvalResult<ConstValue> TableConstEvaluator::eval_global(const Instance& instance) {
    return opaque(instance.def);
}

EvalResult<std::optional<ValTree>> TableConstEvaluator::eval_unevaluated_for_typeck(const UnevaluatedConst& uneval) {
    return structured(uneval.def);
}

EvalResult<ConstValue> TableConstEvaluator::eval_unevaluated(const UnevaluatedConst& uneval) {
    return opaque(uneval.def);
}

LitToConstResult TableConstEvaluator::lit_to_const(const LitToConstInput& input) {
    return const_eval::lit_to_const(types, input);
}

} // namespace const_eval
