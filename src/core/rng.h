#pragma once

#include <cstdint>
#include <limits>

namespace sprocket::core {

// PCG-XSH-RR. Satisfies UniformRandomBitGenerator so it plugs into <random>
// distributions and chance::WeightedPicker.
class Pcg32 {
public:
    using result_type = std::uint32_t;

    explicit Pcg32(std::uint64_t seed = 0x853c49e6748fea9bULL) : m_state(seed) {}

    static constexpr result_type min() { return 0u; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()() { return nextU32(); }

    std::uint32_t nextU32() {
        const std::uint64_t old = m_state;
        m_state = old * 6364136223846793005ULL + 1442695040888963407ULL;
        const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const std::uint32_t rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
    }

    float nextFloat01() {
        return static_cast<float>(nextU32() >> 8u) * (1.0f / 16777216.0f);
    }

private:
    std::uint64_t m_state;
};

} // namespace sprocket::core
