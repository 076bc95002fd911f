#include "../../include/random_utils.hpp"
#include <cstdio>
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

namespace qshift::RandomUtils {

unsigned long long next_u64() {
    return dist(rng);
}

std::string random_suffix() {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", next_u64());
    return buf;
}

} // namespace qshift::RandomUtils
