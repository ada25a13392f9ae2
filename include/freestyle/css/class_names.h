#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace freestyle::css {

// Class names paired with whether they apply.
using ClassFlags = std::vector<std::pair<std::string, bool>>;

// One argument to join_class_names(): a class name, a nested list, a set of
// conditional class names, or nothing.
class ClassListItem {
public:
    enum class Kind { Null, Name, List, Flags };

    ClassListItem(std::nullptr_t) {}
    ClassListItem(const char* name);
    ClassListItem(std::string name);
    ClassListItem(std::vector<ClassListItem> list);
    ClassListItem(ClassFlags flags);

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    const std::vector<ClassListItem>& list() const { return list_; }
    const ClassFlags& flags() const { return flags_; }

private:
    Kind kind_ = Kind::Null;
    std::string name_;
    std::vector<ClassListItem> list_;
    ClassFlags flags_;
};

// Flattens the items into a single space separated class attribute value.
// Null items are skipped and flags contribute only names set to true.
std::string join_class_names(const std::vector<ClassListItem>& items);

} // namespace freestyle::css
