#include "insight/domain_signature.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace ember {

std::string DomainSignature::toString() const {
    std::ostringstream oss;
    oss << "d" << dimensions << "[";
    for (size_t i = 0; i < bins.size(); i++) {
        if (i > 0) oss << ",";
        oss << static_cast<int>(bins[i]);
    }
    oss << "]";
    return oss.str();
}

DomainSignature SignatureEncoder::compute(const FeatureDelta& direction) {
    DomainSignature sig;
    sig.dimensions = static_cast<uint32_t>(direction.size());
    sig.bins.assign(direction.size(), 0);

    FeatureDelta unit = direction;
    if (!normalize(unit)) return sig;

    for (size_t i = 0; i < unit.size(); i++) {
        long level = std::lround(unit[i] * kLevels);
        level = std::max<long>(-kLevels, std::min<long>(kLevels, level));
        sig.bins[i] = static_cast<int8_t>(level);
    }
    return sig;
}

uint32_t SignatureEncoder::distance(const DomainSignature& a, const DomainSignature& b) {
    const size_t shared = std::min(a.bins.size(), b.bins.size());
    uint32_t d = 0;
    for (size_t i = 0; i < shared; i++) {
        d += static_cast<uint32_t>(std::abs(a.bins[i] - b.bins[i]));
    }
    const size_t longer = std::max(a.bins.size(), b.bins.size());
    d += static_cast<uint32_t>((longer - shared) * 2 * kLevels);
    return d;
}

double SignatureEncoder::similarity(const DomainSignature& a, const DomainSignature& b) {
    if (a == b) return 1.0;
    const size_t longer = std::max(a.bins.size(), b.bins.size());
    if (longer == 0) return 1.0;
    double worst = static_cast<double>(longer * 2 * kLevels);
    return std::max(0.0, 1.0 - distance(a, b) / worst);
}

} // namespace ember
