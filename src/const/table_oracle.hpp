#pragma once

#include "const/oracle.hpp"
#include "type/type.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace const_eval {

/**
 * @brief Constant evaluator answering from registered definitions.
 *
 * Each constant definition maps to one outcome: a valtree, an opaque value
 * without valtree form, a TooGeneric failure or a reported failure.
 * Associated constants are resolved through impls registered per self type
 * (the first generic argument of the use site).
 */
class TableConstEvaluator : public ConstEvalOracle {
public:
    explicit TableConstEvaluator(type::TypeContext& types) : types(types) {}

    void define_value(DefId def, ValTree value);
    void define_opaque(DefId def, ConstValue value);
    void define_too_generic(DefId def);
    void define_failure(DefId def, std::string message);

    // `trait_const` resolves to `impl_const` when used with `self_ty`.
    void register_assoc_impl(DefId trait_const, type::TypeId self_ty, DefId impl_const);
    void declare_assoc_const(DefId trait_const);
    void mark_resolution_failure(DefId def) { failing_resolutions.insert(def); }

    InstanceResolution resolve_instance(DefId def, const GenericArgs& args) override;
    EvalResult<std::optional<ValTree>> eval_global_for_typeck(const Instance& instance) override;
    EvalResult<ConstValue> eval_global(const Instance& instance) override;
    EvalResult<std::optional<ValTree>> eval_unevaluated_for_typeck(const UnevaluatedConst& uneval) override;
    EvalResult<ConstValue> eval_unevaluated(const UnevaluatedConst& uneval) override;
    LitToConstResult lit_to_const(const LitToConstInput& input) override;

    size_t evaluation_count() const { return evaluations; }

private:
    struct Entry {
        enum class Outcome { Value, Opaque, TooGeneric, Failed };

        Outcome outcome = Outcome::Failed;
        std::optional<ValTree> valtree;
        ConstValue opaque = ZeroSized{};
        std::string failure_message;
    };

    type::TypeContext& types;
    std::unordered_map<DefId, Entry> entries;
    std::unordered_set<DefId> assoc_consts;
    std::map<std::pair<DefId, type::TypeId>, DefId> assoc_impls;
    std::unordered_set<DefId> failing_resolutions;
    size_t evaluations = 0;

    const Entry* lookup(DefId def) const;
    EvalResult<std::optional<ValTree>> structured(DefId def);
    EvalResult<ConstValue> opaque(DefId def);
};

} // namespace const_eval
