#include <freestyle/url/percent_encoding.h>
#include <freestyle/core/config.h>

namespace freestyle::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

// Characters that are never percent-encoded
bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~' ||
           c == '!' || c == '*' || c == '\'' || c == '(' || c == ')';
}

// Delimiters that keep their meaning inside a full URI
bool is_reserved(char c) {
    return c == ';' || c == ',' || c == '/' || c == '?' || c == ':' ||
           c == '@' || c == '&' || c == '=' || c == '+' || c == '$' ||
           c == '#';
}

} // anonymous namespace

std::string percent_encode(std::string_view input, EncodeSet set) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (is_unreserved(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else if (set == EncodeSet::Uri && is_reserved(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        }
    }

    return result;
}

std::string css_url(std::string_view input) {
    std::string result = core::config::kUrlPrefix;
    result += percent_encode(input, EncodeSet::Uri);
    result += core::config::kUrlSuffix;
    return result;
}

} // namespace freestyle::url
