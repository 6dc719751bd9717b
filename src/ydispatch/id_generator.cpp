#include "id_generator.hpp"
#include <random>

namespace ydispatch {

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out;
    out.reserve(36);
    auto write = [&](uint64_t v, int shift_from, int nibbles) {
        for (int i = 0; i < nibbles; ++i) {
            out.push_back(hex[(v >> (shift_from - 4 * i)) & 0xF]);
        }
    };
    write(hi, 60, 8);
    out.push_back('-');
    write(hi, 28, 4);
    out.push_back('-');
    write(hi, 12, 4);
    out.push_back('-');
    write(lo, 60, 4);
    out.push_back('-');
    write(lo, 44, 12);
    return out;
}

IdGeneratorPtr default_id_generator() {
    static IdGeneratorPtr generator = std::make_shared<DefaultIdGenerator>();
    return generator;
}

} // namespace ydispatch
