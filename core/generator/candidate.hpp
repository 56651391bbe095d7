#pragma once

#include "space/feature_vector.hpp"
#include "metric/distance.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ember {

/// One ephemeral point under evaluation. Owned by the batch that produced
/// it and never outlives the iteration; nothing durable may point at it.
struct Candidate {
    uint64_t index = 0;            // position within its batch
    FeatureVector features;
    std::string payload;           // opaque, application-encoded
    std::shared_ptr<const void> resource;  // optional, released with the candidate

    Candidate() = default;
    Candidate(uint64_t index, FeatureVector features)
        : index(index), features(std::move(features)) {}
};

struct ScoredCandidate {
    Candidate candidate;
    Distance distance;
};

} // namespace ember
