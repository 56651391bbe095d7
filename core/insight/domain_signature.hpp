#pragma once

#include "insight/insight.hpp"

namespace ember {

// ─── Signature Encoder ─────────────────────────────────────────
// Builds DomainSignatures and compares them for approximate lookup.
// Each direction component maps to one of 2 * kLevels + 1 bins.

class SignatureEncoder {
public:
    static constexpr int kLevels = 2;

    /// Signature of a direction. The input need not be normalized;
    /// a zero vector yields all-zero bins.
    static DomainSignature compute(const FeatureDelta& direction);

    /// L1 distance over bins, plus a full-range penalty per dimension
    /// present in only one of the two signatures.
    static uint32_t distance(const DomainSignature& a, const DomainSignature& b);

    /// 1.0 = identical, 0.0 = maximally different.
    static double similarity(const DomainSignature& a, const DomainSignature& b);
};

} // namespace ember
