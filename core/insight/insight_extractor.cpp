#include "insight/insight_extractor.hpp"
#include "insight/domain_signature.hpp"

#include <algorithm>
#include <cmath>

namespace ember {

InsightExtractor::InsightExtractor(DomainId domain, ExtractorConfig config)
    : domain_(std::move(domain)), config_(config) {}

void InsightExtractor::seed(const FeatureVector& features, const Distance& distance,
                            std::string payload) {
    best_features_ = features;
    best_distance_ = distance;
    best_payload_ = std::move(payload);
    has_best_ = true;
}

std::optional<Insight> InsightExtractor::extract(const Candidate& candidate,
                                                 const Distance& distance) {
    if (!has_best_) {
        seed(candidate.features, distance, candidate.payload);
        discarded_++;
        return std::nullopt;
    }

    FeatureDelta delta = difference(candidate.features, best_features_);
    double step = norm(delta);
    double reference = best_distance_.total;
    if (!(step > 0.0) || !std::isfinite(step) || !(reference > 0.0)) {
        discarded_++;
        return std::nullopt;
    }

    const double gain = reference - distance.total;
    double confidence = std::min(1.0, std::abs(gain) / reference);

    Insight insight;
    insight.source_domain = domain_;

    if (gain > 0.0) {
        insight.attractive = true;
        insight.direction = delta;
        best_features_ = candidate.features;
        best_distance_ = distance;
        best_payload_ = candidate.payload;
    } else {
        confidence *= config_.repulsive_discount;
        if (!best_distance_.improvedOnAnyAxis(distance) && confidence < config_.threshold) {
            discarded_++;
            return std::nullopt;
        }
        insight.attractive = false;
        insight.direction = difference(best_features_, candidate.features);
    }

    normalize(insight.direction);
    insight.confidence = std::max(0.0, confidence);
    insight.signature = SignatureEncoder::compute(insight.direction);
    extracted_++;
    return insight;
}

} // namespace ember
