#pragma once
#include <string>
#include <string_view>

namespace freestyle::css {

// Resolves a nested selector against its parent. Every "&" in `selector`
// is replaced by `parent`; without a "&" the result is the descendant
// selector "<parent> <selector>".
std::string interpolate(std::string_view selector, std::string_view parent);

} // namespace freestyle::css
