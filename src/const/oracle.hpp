#pragma once

#include "const/const.hpp"
#include "hir/hir.hpp"
#include "utils/error.hpp"

#include <optional>
#include <string>
#include <variant>

namespace const_eval {

struct EvalError {
    enum class Kind { TooGeneric, Reported };

    Kind kind = Kind::Reported;
    // Only meaningful for Reported.
    Diagnostic diagnostic;

    static EvalError too_generic() { return EvalError{.kind = Kind::TooGeneric, .diagnostic = {}}; }
    static EvalError reported(Diagnostic diag) { return EvalError{.kind = Kind::Reported, .diagnostic = std::move(diag)}; }
};

template <typename T>
using EvalResult = std::variant<T, EvalError>;

struct InstanceResolution {
    enum class Status {
        Resolved,
        // No impl provides the item for these generic arguments.
        NoInstance,
        Failed,
    };

    Status status = Status::Failed;
    Instance instance;
};

struct LitToConstInput {
    const hir::Literal* lit = nullptr;
    TypeId ty = type::invalid_type_id;
    bool negated = false;
};

struct LitToConstError {
    enum class Kind {
        Reported,
        // The literal does not fit the type at all; type checking should have
        // rejected it.
        TypeError,
    };

    Kind kind = Kind::TypeError;
    Diagnostic diagnostic;
};

using LitToConstResult = std::variant<Const, LitToConstError>;

/**
 * @brief Constant evaluation as seen from pattern lowering.
 *
 * Calls are synchronous. A TooGeneric result is a property of the request and
 * must be propagated, never retried.
 */
class ConstEvalOracle {
public:
    virtual ~ConstEvalOracle() = default;

    virtual InstanceResolution resolve_instance(DefId def, const GenericArgs& args) = 0;

    // Structured result; nullopt when the value has no valtree form.
    virtual EvalResult<std::optional<ValTree>> eval_global_for_typeck(const Instance& instance) = 0;
    virtual EvalResult<ConstValue> eval_global(const Instance& instance) = 0;

    virtual EvalResult<std::optional<ValTree>> eval_unevaluated_for_typeck(const UnevaluatedConst& uneval) = 0;
    virtual EvalResult<ConstValue> eval_unevaluated(const UnevaluatedConst& uneval) = 0;

    virtual LitToConstResult lit_to_const(const LitToConstInput& input) = 0;
};

} // namespace const_eval
