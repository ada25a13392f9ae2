#include <freestyle/hash/hasher.h>
#include <freestyle/core/config.h>
#include <algorithm>

namespace freestyle::hash {

namespace {

constexpr char base32_digits[] = "0123456789abcdefghijklmnopqrstuv";

} // anonymous namespace

uint32_t hash(std::string_view text, uint32_t seed) {
    uint32_t value = seed != 0 ? seed : core::config::kHashSeed;

    for (unsigned char c : text) {
        value ^= c;
        // Multiply by the FNV prime 0x01000193, spelled as shifts.
        value += (value << 1) + (value << 4) + (value << 7) + (value << 8) + (value << 24);
    }

    return value;
}

std::string hash_to_string(uint32_t value) {
    if (value == 0) return "0";

    std::string result;
    while (value > 0) {
        result += base32_digits[value % core::config::kHashRadix];
        value /= core::config::kHashRadix;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::string hash_string(std::string_view text) {
    return hash_to_string(hash(text));
}

} // namespace freestyle::hash
