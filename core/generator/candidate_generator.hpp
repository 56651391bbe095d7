#pragma once

#include "generator/candidate.hpp"
#include "space/window.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace ember {

/// Encodes a feature vector into the application's opaque payload.
using PayloadEncoder = std::function<std::string(const FeatureVector&)>;

class CandidateGenerator;

// ─── Candidate Batch ───────────────────────────────────────────
// Lazy, finite, non-restartable sequence of candidates. Each call to
// next() claims one index from an atomic cursor and synthesizes that
// candidate from its own RNG, so concurrent callers share nothing else.

class CandidateBatch {
public:
    CandidateBatch(const CandidateBatch&) = delete;
    CandidateBatch& operator=(const CandidateBatch&) = delete;

    /// Next candidate, or nullopt once the batch is drained.
    std::optional<Candidate> next();

    size_t size() const { return size_; }
    size_t remaining() const;
    uint64_t iteration() const { return iteration_; }

private:
    friend class CandidateGenerator;

    CandidateBatch(const CandidateGenerator& generator, Window window,
                   size_t size, double bias_factor,
                   uint64_t seed, uint64_t iteration);

    const CandidateGenerator& generator_;
    Window window_;
    size_t size_;
    double bias_factor_;
    uint64_t seed_;
    uint64_t iteration_;
    std::atomic<size_t> cursor_{0};
};

// ─── Candidate Generator ───────────────────────────────────────
// Samples candidates inside a window. bias_factor = 1 samples the ball
// uniformly; larger values push mass toward the boundary, where
// candidates tend to carry more directional information.

class CandidateGenerator {
public:
    explicit CandidateGenerator(PayloadEncoder encoder = nullptr);
    virtual ~CandidateGenerator() = default;

    /// Start a batch. Throws GeneratorError::DegenerateWindow when the
    /// radius has collapsed, ConfigError on a bad batch size or bias.
    CandidateBatch generateBatch(const Window& window, size_t batch_size,
                                 double bias_factor, uint64_t seed,
                                 uint64_t iteration = 0) const;

    /// Draw a single candidate. Must only touch `rng` and its arguments.
    virtual Candidate sample(const Window& window, double bias_factor,
                             uint64_t index, std::mt19937_64& rng) const;

    /// "x0,x1,..." with full precision.
    static std::string defaultPayload(const FeatureVector& features);

protected:
    std::string encode(const FeatureVector& features) const;

private:
    PayloadEncoder encoder_;
};

} // namespace ember
