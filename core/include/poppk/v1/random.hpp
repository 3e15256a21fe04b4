#pragma once

// =============================================================================
// poppk - Random streams
// =============================================================================
// A RandomStream is the only source of randomness in the simulator. The
// population driver owns it and the variability kernel borrows it per call,
// so the draw order is fully determined by the call order.
// =============================================================================

#include "poppk/v1/types.hpp"

#include <cstdint>
#include <optional>
#include <random>

namespace poppk::v1 {

/// SplitMix64 finaliser, used to derive independent child seeds
[[nodiscard]] inline constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

/// Seed of the per-patient stream in parallel mode
[[nodiscard]] inline constexpr std::uint64_t derive_patient_seed(std::uint64_t root_seed,
                                                                 PatientId patient_id) noexcept {
    return splitmix64(root_seed ^ splitmix64(static_cast<std::uint64_t>(patient_id)));
}

/// Seed drawn from the operating system entropy source
[[nodiscard]] inline std::uint64_t entropy_seed() {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device());
}

/// Deterministic Gaussian stream
class RandomStream {
public:
    explicit RandomStream(std::uint64_t seed) : seed_(seed), engine_(seed) {}

    /// Seeded from `seed` when given, from entropy otherwise
    [[nodiscard]] static RandomStream from_optional_seed(std::optional<std::uint64_t> seed) {
        return RandomStream(seed ? *seed : entropy_seed());
    }

    /// Draw from Normal(mean, sd); sd == 0 still consumes one draw
    [[nodiscard]] Real normal(Real mean, Real sd) {
        return mean + sd * standard_normal_(engine_);
    }

    [[nodiscard]] Real standard_normal() { return standard_normal_(engine_); }

    [[nodiscard]] std::uint64_t seed() const { return seed_; }

    void reseed(std::uint64_t seed) {
        seed_ = seed;
        engine_.seed(seed);
        standard_normal_.reset();
    }

private:
    std::uint64_t seed_;
    std::mt19937_64 engine_;
    std::normal_distribution<Real> standard_normal_{0.0, 1.0};
};

}  // namespace poppk::v1
