#ifndef FREESTYLE_CORE_CONFIG_H
#define FREESTYLE_CORE_CONFIG_H

#include <cstdint>

namespace freestyle::core::config {

inline constexpr std::uint32_t kHashSeed = 0x811c9dc5u;
inline constexpr std::uint32_t kHashRadix = 32;

// Placeholder that nested selectors use to reference their parent.
inline constexpr const char kRootSelector[] = "&";
inline constexpr const char kClassSelectorPrefix[] = ".";

inline constexpr char kSelectorIdPrefix = 's';
inline constexpr char kStyleIdPrefix = 'n';
inline constexpr char kAtRuleIdPrefix = 'a';

inline constexpr const char kUrlPrefix[] = "url(\"";
inline constexpr const char kUrlSuffix[] = "\")";

}  // namespace freestyle::core::config

#endif  // FREESTYLE_CORE_CONFIG_H
