#include <freestyle/css/property_compiler.h>
#include <algorithm>
#include <cctype>

namespace freestyle::css {

namespace {

bool is_css_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string scalar_declaration(const std::string& name, const Scalar& value) {
    if (value.is_null()) return "";
    return name + ":" + value.to_string() + ";";
}

} // anonymous namespace

std::string trim(std::string_view text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && is_css_whitespace(text[start])) ++start;
    while (end > start && is_css_whitespace(text[end - 1])) --end;
    return std::string(text.substr(start, end - start));
}

std::string hyphenate(std::string_view property_name) {
    std::string result;
    result.reserve(property_name.size() + 4);

    for (char c : property_name) {
        if (c >= 'A' && c <= 'Z') {
            result += '-';
        }
        result += c;
    }

    // Internet Explorer vendor prefix is written "ms", not "Ms".
    if (result.compare(0, 3, "ms-") == 0) {
        result.insert(result.begin(), '-');
    }

    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool is_at_rule(std::string_view key) {
    return !key.empty() && key[0] == '@';
}

ParsedLayer parse_style_layer(const StyleLayer& layer) {
    std::vector<const StyleLayer::Entry*> entries;
    entries.reserve(layer.size());
    for (const auto& entry : layer) {
        entries.push_back(&entry);
    }

    // Sorting before compilation makes the output independent of the
    // order the caller inserted keys in.
    std::sort(entries.begin(), entries.end(),
        [](const StyleLayer::Entry* a, const StyleLayer::Entry* b) {
            return a->first < b->first;
        });

    ParsedLayer parsed;
    for (const auto* entry : entries) {
        std::string key = trim(entry->first);
        if (entry->second.is_nested()) {
            parsed.nested_styles.push_back({std::move(key), entry->second});
        } else {
            parsed.properties.push_back({hyphenate(key), entry->second});
        }
    }
    return parsed;
}

std::string property_to_string(const std::string& name, const StyleValue& value) {
    if (value.is_array()) {
        std::string result;
        for (const auto& item : value.array()) {
            result += scalar_declaration(name, item);
        }
        return result;
    }
    return scalar_declaration(name, value.scalar());
}

std::string compile_properties(const std::vector<Property>& properties) {
    std::string result;
    for (const auto& property : properties) {
        result += property_to_string(property.name, property.value);
    }
    return result;
}

} // namespace freestyle::css
