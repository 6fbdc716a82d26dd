#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "span/span.hpp"

class CompilerError : public std::runtime_error {
public:
    explicit CompilerError(const std::string& message,
                           span::Span span = span::Span::invalid())
        : std::runtime_error(message), span_(span) {}

    span::Span span() const { return span_; }

protected:
    span::Span span_ = span::Span::invalid();
};

class SemanticError : public CompilerError {
public:
    explicit SemanticError(const std::string& message,
                           span::Span span = span::Span::invalid())
        : CompilerError(message, span) {}
};

// Kinds of user-facing pattern errors. Internal invariant violations are not
// listed here: they throw std::logic_error instead.
enum class ErrorKind {
    MalformedRange,
    LiteralOverflow,
    UnboundedRange,
    InvalidRangeEndpoint,
    ConstGenericParameterInPattern,
    StaticInPattern,
    NonConstantPath,
    AssociatedConstantUnresolved,
    ConstantEvaluationTooGeneric,
    ConstantEvaluationFailed,
    LiteralConversionFailed,
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedRange: return "MalformedRange";
        case ErrorKind::LiteralOverflow: return "LiteralOverflow";
        case ErrorKind::UnboundedRange: return "UnboundedRange";
        case ErrorKind::InvalidRangeEndpoint: return "InvalidRangeEndpoint";
        case ErrorKind::ConstGenericParameterInPattern: return "ConstGenericParameterInPattern";
        case ErrorKind::StaticInPattern: return "StaticInPattern";
        case ErrorKind::NonConstantPath: return "NonConstantPath";
        case ErrorKind::AssociatedConstantUnresolved: return "AssociatedConstantUnresolved";
        case ErrorKind::ConstantEvaluationTooGeneric: return "ConstantEvaluationTooGeneric";
        case ErrorKind::ConstantEvaluationFailed: return "ConstantEvaluationFailed";
        case ErrorKind::LiteralConversionFailed: return "LiteralConversionFailed";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << to_string(kind);
}

struct Diagnostic {
    ErrorKind kind = ErrorKind::NonConstantPath;
    std::string message;
    span::Span span = span::Span::invalid();
    std::vector<std::string> notes;
};

// Handle to an emitted diagnostic. Holding one proves the error was reported.
struct DiagnosticId {
    uint32_t index = 0;

    bool operator==(const DiagnosticId&) const = default;
};

class DiagnosticSink {
public:
    DiagnosticId emit(Diagnostic diagnostic) {
        DiagnosticId id{static_cast<uint32_t>(diagnostics_.size())};
        diagnostics_.push_back(std::move(diagnostic));
        return id;
    }

    DiagnosticId emit(ErrorKind kind, std::string message, span::Span span) {
        return emit(Diagnostic{.kind = kind, .message = std::move(message), .span = span, .notes = {}});
    }

    const Diagnostic& get(DiagnosticId id) const { return diagnostics_.at(id.index); }
    const std::vector<Diagnostic>& all() const { return diagnostics_; }
    size_t count() const { return diagnostics_.size(); }
    bool empty() const { return diagnostics_.empty(); }

    size_t count(ErrorKind kind) const {
        size_t n = 0;
        for (const auto& diag : diagnostics_) {
            if (diag.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    // Escalate the first recorded diagnostic into a thrown SemanticError.
    void raise_first() const {
        if (!diagnostics_.empty()) {
            throw SemanticError(diagnostics_.front().message, diagnostics_.front().span);
        }
    }

private:
    std::vector<Diagnostic> diagnostics_;
};
