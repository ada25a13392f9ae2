#include <freestyle/css/selector_interpolator.h>

namespace freestyle::css {

std::string interpolate(std::string_view selector, std::string_view parent) {
    if (selector.find('&') == std::string_view::npos) {
        std::string result;
        result.reserve(parent.size() + 1 + selector.size());
        result.append(parent);
        result += ' ';
        result.append(selector);
        return result;
    }

    std::string result;
    for (char c : selector) {
        if (c == '&') {
            result.append(parent);
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace freestyle::css
