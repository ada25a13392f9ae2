#pragma once
#include <freestyle/css/style_value.h>
#include <string>
#include <string_view>
#include <vector>

namespace freestyle::css {

struct Property {
    std::string name;   // hyphenated CSS property name
    StyleValue value;   // Scalar or ScalarArray
};

struct NestedStyle {
    std::string key;    // selector fragment or at-rule text, trimmed
    StyleValue value;   // always a NestedLayer
};

// One style layer split into declarations and nested blocks, both in
// sorted key order.
struct ParsedLayer {
    std::vector<Property> properties;
    std::vector<NestedStyle> nested_styles;
};

ParsedLayer parse_style_layer(const StyleLayer& layer);

// backgroundColor -> background-color, msTransform -> -ms-transform
std::string hyphenate(std::string_view property_name);

bool is_at_rule(std::string_view key);

std::string trim(std::string_view text);

// "name:value;" per value; null values produce nothing.
std::string property_to_string(const std::string& name, const StyleValue& value);

std::string compile_properties(const std::vector<Property>& properties);

} // namespace freestyle::css
