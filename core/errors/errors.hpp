#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ember {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure a search run can report. All derive from EngineError,
// which is a std::runtime_error, so callers may catch at any level.

enum class ErrorKind {
    Config,
    Metric,
    Generator,
    Cache
};

enum class ErrorSeverity {
    Low,
    Medium,
    High,
    Critical
};

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    ErrorSeverity severity() const;

    /// True when the engine may recover from this error inside a run
    /// (only a degenerate window qualifies, and only once).
    bool allowsContinuation() const;

private:
    ErrorKind kind_;
};

/// Invalid problem descriptor, budget, or configuration.
/// Raised before any iteration executes.
class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(ErrorKind::Config, "config: " + message) {}
};

/// A malformed candidate reached the distance metric.
class MetricError : public EngineError {
public:
    enum class Code {
        DimensionMismatch,
        NonFinite
    };

    MetricError(Code code, const std::string& message)
        : EngineError(ErrorKind::Metric, "metric: " + message), code_(code) {}

    static MetricError dimensionMismatch(size_t expected, size_t actual);
    static MetricError nonFinite(size_t index);

    Code code() const { return code_; }

private:
    Code code_;
};

class GeneratorError : public EngineError {
public:
    enum class Code {
        DegenerateWindow,
        DimensionMismatch
    };

    GeneratorError(Code code, const std::string& message)
        : EngineError(ErrorKind::Generator, "generator: " + message), code_(code) {}

    static GeneratorError degenerateWindow(double radius);

    Code code() const { return code_; }

private:
    Code code_;
};

/// Lock contention on the shared insight cache outlasted the retry bound.
class CacheError : public EngineError {
public:
    explicit CacheError(const std::string& message)
        : EngineError(ErrorKind::Cache, "cache: " + message) {}
};

std::string toString(ErrorKind kind);

} // namespace ember
