#pragma once

#include "insight/insight.hpp"
#include "generator/candidate.hpp"
#include "metric/distance.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ember {

struct ExtractorConfig {
    double threshold = 0.05;          // τ: minimum confidence for a non-improving candidate
    double repulsive_discount = 0.5;  // confidence scale for insights learned from worse points
};

// ─── Insight Extractor ─────────────────────────────────────────
// Turns one scored candidate into (at most) one Insight by finite
// difference against the running best point. Only that single best
// point is retained, which is what lets every other candidate be
// dropped as soon as it has been scored and extracted.
//
// Improving candidate: direction best → candidate, the candidate
// becomes the new best. Worse candidate: direction candidate → best,
// kept only if some axis still improved or confidence reaches τ.

class InsightExtractor {
public:
    explicit InsightExtractor(DomainId domain, ExtractorConfig config = {});

    /// Install the reference point (usually the initial window center).
    void seed(const FeatureVector& features, const Distance& distance, std::string payload);

    std::optional<Insight> extract(const Candidate& candidate, const Distance& distance);

    bool hasBest() const { return has_best_; }
    const FeatureVector& bestFeatures() const { return best_features_; }
    const Distance& bestDistance() const { return best_distance_; }
    const std::string& bestPayload() const { return best_payload_; }

    uint64_t extractedCount() const { return extracted_; }
    uint64_t discardedCount() const { return discarded_; }

    const DomainId& domain() const { return domain_; }
    const ExtractorConfig& config() const { return config_; }

private:
    DomainId domain_;
    ExtractorConfig config_;

    bool has_best_ = false;
    FeatureVector best_features_;
    Distance best_distance_;
    std::string best_payload_;

    uint64_t extracted_ = 0;
    uint64_t discarded_ = 0;
};

} // namespace ember
