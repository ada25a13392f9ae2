#pragma once
#include <string>
#include <string_view>

namespace freestyle::url {

enum class EncodeSet {
    Uri,        // keeps URI delimiters such as / ? # & =
    Component,  // escapes delimiters as well
};

std::string percent_encode(std::string_view input, EncodeSet set = EncodeSet::Uri);

// url("<percent-encoded input>") for use as a CSS property value.
std::string css_url(std::string_view input);

} // namespace freestyle::url
