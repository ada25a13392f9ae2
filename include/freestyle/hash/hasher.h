#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace freestyle::hash {

// 32-bit FNV-1a style hash over the bytes of `text`. A zero seed starts
// from the FNV offset basis, so results can be chained by passing the
// previous hash back in as the seed.
uint32_t hash(std::string_view text, uint32_t seed = 0);

// Base-32 rendering (digits 0-9a-v), no padding.
std::string hash_to_string(uint32_t value);

std::string hash_string(std::string_view text);

} // namespace freestyle::hash
