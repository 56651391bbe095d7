#pragma once

#include "space/feature_vector.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ember {

/// Identifies one problem instance. Free-form; only compared for equality.
using DomainId = std::string;

// ─── Domain Signature ──────────────────────────────────────────
// Domain-independent fingerprint of a direction's shape: each component
// of the unit direction quantized to a small signed level. Two insights
// with equal signatures are transfer candidates whatever their origin.

struct DomainSignature {
    uint32_t dimensions = 0;
    std::vector<int8_t> bins;

    bool operator==(const DomainSignature& other) const {
        return dimensions == other.dimensions && bins == other.bins;
    }
    bool operator!=(const DomainSignature& other) const { return !(*this == other); }

    bool empty() const { return dimensions == 0; }

    /// e.g. "d3[-1,0,2]"
    std::string toString() const;
};

struct DomainSignatureHash {
    size_t operator()(const DomainSignature& s) const {
        uint64_t h = 1469598103934665603ULL ^ s.dimensions;
        for (int8_t b : s.bins) {
            h ^= static_cast<uint8_t>(b);
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

// ─── Insight ───────────────────────────────────────────────────
// The only long-lived artifact of a search: a unit directional
// correction plus how much to trust it. Never refers to a Candidate.

struct Insight {
    DomainSignature signature;
    FeatureDelta direction;        // unit length
    double confidence = 0.0;       // [0, 1]
    DomainId source_domain;
    bool attractive = true;        // false: learned by moving away from a worse point
    uint64_t transfer_count = 1;   // insertions merged into this record
    bool spans_run = false;        // whole-run displacement: initial center → final best
};

} // namespace ember
