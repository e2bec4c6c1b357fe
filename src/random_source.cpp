#include "holdem/random_source.hpp"
#include <algorithm>

namespace holdem {

std::size_t RandomSource::below(std::size_t bound) {
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    return dist(*this);
}

MersenneRandomSource::MersenneRandomSource() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : engine_(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32))) {}

RandomSource& default_random_source() {
    thread_local MersenneRandomSource source;
    return source;
}

std::uint64_t seed_from_bytes(const std::string& seed_bytes) {
    std::uint64_t seed = 0;
    for (size_t i = 0; i < std::min(seed_bytes.size(), size_t(8)); ++i) {
        seed = (seed << 8) | static_cast<uint8_t>(seed_bytes[i]);
    }
    return seed;
}

} // namespace holdem
