#include "errors/errors.hpp"

#include <sstream>

namespace ember {

ErrorSeverity EngineError::severity() const {
    switch (kind_) {
        case ErrorKind::Metric:    return ErrorSeverity::Critical;
        case ErrorKind::Config:    return ErrorSeverity::High;
        case ErrorKind::Cache:     return ErrorSeverity::Medium;
        case ErrorKind::Generator: return ErrorSeverity::Low;
    }
    return ErrorSeverity::High;
}

bool EngineError::allowsContinuation() const {
    if (kind_ != ErrorKind::Generator) return false;
    auto* gen = dynamic_cast<const GeneratorError*>(this);
    return gen != nullptr && gen->code() == GeneratorError::Code::DegenerateWindow;
}

MetricError MetricError::dimensionMismatch(size_t expected, size_t actual) {
    std::ostringstream oss;
    oss << "dimension mismatch: expected " << expected << ", got " << actual;
    return MetricError(Code::DimensionMismatch, oss.str());
}

MetricError MetricError::nonFinite(size_t index) {
    return MetricError(Code::NonFinite,
                       "non-finite feature at index " + std::to_string(index));
}

GeneratorError GeneratorError::degenerateWindow(double radius) {
    std::ostringstream oss;
    oss << "degenerate window (radius " << radius << ")";
    return GeneratorError(Code::DegenerateWindow, oss.str());
}

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config:    return "config";
        case ErrorKind::Metric:    return "metric";
        case ErrorKind::Generator: return "generator";
        case ErrorKind::Cache:     return "cache";
    }
    return "unknown";
}

} // namespace ember
