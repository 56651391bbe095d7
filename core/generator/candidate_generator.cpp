#include "generator/candidate_generator.hpp"
#include "errors/errors.hpp"
#include "util/logging.hpp"
#include "util/random.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace ember {

namespace {

/// A radius that no longer moves any coordinate would only ever
/// reproduce the center, so it counts as collapsed.
bool isDegenerate(const Window& window) {
    if (!std::isfinite(window.radius) ||
        window.radius < std::numeric_limits<double>::min()) {
        return true;
    }
    for (double c : window.center) {
        if (c + window.radius != c) return false;
    }
    return true;
}

} // namespace

// ─── CandidateBatch ────────────────────────────────────────────

CandidateBatch::CandidateBatch(const CandidateGenerator& generator, Window window,
                               size_t size, double bias_factor,
                               uint64_t seed, uint64_t iteration)
    : generator_(generator),
      window_(std::move(window)),
      size_(size),
      bias_factor_(bias_factor),
      seed_(seed),
      iteration_(iteration) {}

std::optional<Candidate> CandidateBatch::next() {
    size_t index = cursor_.fetch_add(1, std::memory_order_relaxed);
    if (index >= size_) return std::nullopt;

    std::mt19937_64 rng(mixSeed(seed_, iteration_, index));
    return generator_.sample(window_, bias_factor_, index, rng);
}

size_t CandidateBatch::remaining() const {
    size_t claimed = cursor_.load(std::memory_order_relaxed);
    return claimed >= size_ ? 0 : size_ - claimed;
}

// ─── CandidateGenerator ────────────────────────────────────────

CandidateGenerator::CandidateGenerator(PayloadEncoder encoder)
    : encoder_(std::move(encoder)) {}

CandidateBatch CandidateGenerator::generateBatch(const Window& window, size_t batch_size,
                                                 double bias_factor, uint64_t seed,
                                                 uint64_t iteration) const {
    if (batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (!(bias_factor >= 1.0) || !std::isfinite(bias_factor)) {
        throw ConfigError("bias_factor must be >= 1");
    }
    if (window.center.empty()) {
        throw GeneratorError(GeneratorError::Code::DimensionMismatch,
                             "window has no dimensions");
    }
    if (!window.bias.empty() && window.bias.size() != window.center.size()) {
        throw GeneratorError(GeneratorError::Code::DimensionMismatch,
                             "window bias does not match center dimensionality");
    }
    if (isDegenerate(window)) {
        EMBER_LOG_DEBUG(Generator, "Collapsed window at iteration {} (radius {})", iteration, window.radius);
        throw GeneratorError::degenerateWindow(window.radius);
    }
    return CandidateBatch(*this, window, batch_size, bias_factor, seed, iteration);
}

Candidate CandidateGenerator::sample(const Window& window, double bias_factor,
                                     uint64_t index, std::mt19937_64& rng) const {
    const size_t n = window.dimensions();
    std::normal_distribution<double> gauss(0.0, 1.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // Uniform direction on the sphere
    FeatureDelta dir(n, 0.0);
    do {
        for (double& d : dir) d = gauss(rng);
    } while (!normalize(dir));

    // Radial CDF r^(n * bias): bias = 1 is uniform in the ball
    double r = std::pow(unit(rng), 1.0 / (static_cast<double>(n) * bias_factor));
    FeatureDelta offset(n, 0.0);
    for (size_t i = 0; i < n; i++) offset[i] = dir[i] * r;

    if (window.bias_strength > 0.0 && window.bias.size() == n) {
        addScaled(offset, window.bias, window.bias_strength);
        double len = norm(offset);
        if (len > 1.0) {
            for (double& o : offset) o /= len;
        }
    }

    FeatureVector features = window.center;
    addScaled(features, offset, window.radius);

    Candidate c(index, std::move(features));
    c.payload = encode(c.features);
    return c;
}

std::string CandidateGenerator::defaultPayload(const FeatureVector& features) {
    std::ostringstream oss;
    oss.precision(std::numeric_limits<double>::max_digits10);
    for (size_t i = 0; i < features.size(); i++) {
        if (i > 0) oss << ",";
        oss << features[i];
    }
    return oss.str();
}

std::string CandidateGenerator::encode(const FeatureVector& features) const {
    return encoder_ ? encoder_(features) : defaultPayload(features);
}

} // namespace ember
