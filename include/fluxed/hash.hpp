#ifndef FLUXED_HASH_HPP
#define FLUXED_HASH_HPP

#include <cstdint>
#include <cstring>

namespace fluxed {

// ============================================================
// Deterministic RNG (SplitMix64)
// ============================================================
struct SplitMix64 {
    uint64_t state;
    explicit SplitMix64(uint64_t seed) : state(seed) {}
    uint64_t next_u64() {
        uint64_t z = (state += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }
    // [0,1)
    double next_f01() {
        uint64_t x = next_u64() >> 11;
        return double(x) * (1.0 / 9007199254740992.0);
    }
    // [-1,1)
    double next_f11() {
        return 2.0 * next_f01() - 1.0;
    }
};

static inline uint64_t hash_u64(uint64_t x) {
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}

static constexpr uint64_t MIX_AXIS  = 0x9E3779B97F4A7C15ull;
static constexpr uint64_t MIX_VALUE = 0xD1B54A32D192ED03ull;

static inline uint64_t hash_mix(uint64_t h, uint64_t v) {
    return hash_u64(h ^ (v * MIX_VALUE) ^ (h << 6) ^ (h >> 2));
}

static inline uint64_t hash_double(uint64_t h, double v) {
    uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return hash_mix(h, bits);
}

} // namespace fluxed

#endif // FLUXED_HASH_HPP
