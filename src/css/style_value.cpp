#include <freestyle/css/style_value.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace freestyle::css {

// ---------------------------------------------------------------------------
// Scalar
// ---------------------------------------------------------------------------

Scalar::Scalar(const char* text) {
    if (text != nullptr) {
        type_ = Type::String;
        text_ = text;
    }
}

Scalar::Scalar(std::string text) : type_(Type::String), text_(std::move(text)) {}

Scalar::Scalar(double number) : type_(Type::Number), number_(number) {}

Scalar::Scalar(int number) : type_(Type::Number), number_(static_cast<double>(number)) {}

Scalar::Scalar(bool boolean) : type_(Type::Boolean), boolean_(boolean) {}

std::string Scalar::to_string() const {
    switch (type_) {
        case Type::Null:    return "";
        case Type::String:  return text_;
        case Type::Number:  return format_number(number_);
        case Type::Boolean: return boolean_ ? "true" : "false";
    }
    return "";
}

bool Scalar::operator==(const Scalar& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null:    return true;
        case Type::String:  return text_ == other.text_;
        case Type::Number:  return number_ == other.number_;
        case Type::Boolean: return boolean_ == other.boolean_;
    }
    return false;
}

std::string format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";
    if (value == 0) return "0";

    char buf[32];
    if (std::fabs(value) < 1e21 && value == std::trunc(value)) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        return buf;
    }

    // Shortest precision that survives a round trip.
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }

    std::string result = buf;
    auto e = result.find('e');
    if (e == std::string::npos) return result;

    int exponent = std::atoi(result.c_str() + e + 1);
    if (exponent >= -6 && exponent < 0) {
        // %g switches to exponent form below 1e-4, keep fixed form down to 1e-6.
        bool negative = result[0] == '-';
        std::string mantissa;
        for (size_t i = negative ? 1 : 0; i < e; ++i) {
            if (result[i] != '.') mantissa += result[i];
        }
        std::string fixed = negative ? "-0." : "0.";
        fixed.append(static_cast<size_t>(-exponent - 1), '0');
        return fixed + mantissa;
    }

    // printf writes exponents as e-07; drop the padding zeros.
    size_t digits = e + 2;
    size_t first = digits;
    while (first + 1 < result.size() && result[first] == '0') ++first;
    result.erase(digits, first - digits);
    return result;
}

// ---------------------------------------------------------------------------
// StyleValue
// ---------------------------------------------------------------------------

StyleValue::StyleValue(std::vector<Scalar> values)
    : kind_(Kind::ScalarArray), array_(std::move(values)) {}

StyleValue::StyleValue(StyleLayer layer)
    : kind_(Kind::NestedLayer),
      layer_(std::make_shared<const StyleLayer>(std::move(layer))) {}

const StyleLayer& StyleValue::layer() const {
    static const StyleLayer empty_layer;
    if (!layer_) return empty_layer;
    return *layer_;
}

// ---------------------------------------------------------------------------
// StyleLayer
// ---------------------------------------------------------------------------

StyleLayer::StyleLayer(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

StyleLayer& StyleLayer::set(std::string key, StyleValue value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&key](const Entry& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace_back(std::move(key), std::move(value));
    }
    return *this;
}

const StyleValue* StyleLayer::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

bool StyleLayer::erase(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [key](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

} // namespace freestyle::css
