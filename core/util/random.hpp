#pragma once

#include <cstdint>
#include <string>

namespace ember {

/// SplitMix64 finalizer. Good avalanche; used to derive independent
/// per-candidate seeds from (run seed, iteration, index).
inline uint64_t mixSeed(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

inline uint64_t mixSeed(uint64_t a, uint64_t b) {
    return mixSeed(a ^ mixSeed(b));
}

inline uint64_t mixSeed(uint64_t a, uint64_t b, uint64_t c) {
    return mixSeed(mixSeed(a, b), c);
}

/// FNV-1a, stable across platforms (std::hash is not).
inline uint64_t stableHash(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace ember
