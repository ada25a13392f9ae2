#pragma once
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace freestyle::css {

// A single property value. Anything that is not a string, number or
// boolean is represented as Null and renders nothing.
class Scalar {
public:
    enum class Type { Null, String, Number, Boolean };

    Scalar() = default;
    Scalar(std::nullptr_t) {}
    Scalar(const char* text);
    Scalar(std::string text);
    Scalar(double number);
    Scalar(int number);
    Scalar(bool boolean);

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }

    const std::string& text() const { return text_; }
    double number() const { return number_; }
    bool boolean() const { return boolean_; }

    // Renders the value the way it appears after a property colon.
    std::string to_string() const;

    bool operator==(const Scalar& other) const;
    bool operator!=(const Scalar& other) const { return !(*this == other); }

private:
    Type type_ = Type::Null;
    std::string text_;
    double number_ = 0;
    bool boolean_ = false;
};

// Shortest text that reads back as the same double; integers print
// without a fractional part.
std::string format_number(double value);

class StyleLayer;

class StyleValue {
public:
    enum class Kind { Scalar, ScalarArray, NestedLayer };

    StyleValue() = default;
    StyleValue(std::nullptr_t) {}
    StyleValue(const char* text) : scalar_(text) {}
    StyleValue(std::string text) : scalar_(std::move(text)) {}
    StyleValue(double number) : scalar_(number) {}
    StyleValue(int number) : scalar_(number) {}
    StyleValue(bool boolean) : scalar_(boolean) {}
    StyleValue(Scalar scalar) : scalar_(std::move(scalar)) {}
    StyleValue(std::vector<Scalar> values);
    StyleValue(StyleLayer layer);

    Kind kind() const { return kind_; }
    bool is_scalar() const { return kind_ == Kind::Scalar; }
    bool is_array() const { return kind_ == Kind::ScalarArray; }
    bool is_nested() const { return kind_ == Kind::NestedLayer; }

    const Scalar& scalar() const { return scalar_; }
    const std::vector<Scalar>& array() const { return array_; }
    // Only meaningful when is_nested(); returns an empty layer otherwise.
    const StyleLayer& layer() const;

private:
    Kind kind_ = Kind::Scalar;
    Scalar scalar_;
    std::vector<Scalar> array_;
    std::shared_ptr<const StyleLayer> layer_;
};

// One level of a style tree. Keys keep insertion order; compilation sorts
// them, so two layers with the same entries in a different order compile
// identically.
class StyleLayer {
public:
    using Entry = std::pair<std::string, StyleValue>;

    StyleLayer() = default;
    StyleLayer(std::initializer_list<Entry> entries);

    // Replaces the value of an existing key without moving it.
    StyleLayer& set(std::string key, StyleValue value);
    const StyleValue* find(std::string_view key) const;
    bool erase(std::string_view key);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

} // namespace freestyle::css
