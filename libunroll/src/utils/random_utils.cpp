#include "../../include/random_utils.hpp"

#include <array>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix() {
    static constexpr std::array<char, 16> kHex = {
        '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };
    unsigned long long value = next_u64();
    std::string out(16, '0');
    for (auto it = out.rbegin(); it != out.rend(); ++it) {
        *it = kHex[value & 0xF];
        value >>= 4;
    }
    return out;
}
