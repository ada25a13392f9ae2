#include <freestyle/css/class_names.h>

namespace freestyle::css {

ClassListItem::ClassListItem(const char* name) {
    if (name != nullptr) {
        kind_ = Kind::Name;
        name_ = name;
    }
}

ClassListItem::ClassListItem(std::string name)
    : kind_(Kind::Name), name_(std::move(name)) {}

ClassListItem::ClassListItem(std::vector<ClassListItem> list)
    : kind_(Kind::List), list_(std::move(list)) {}

ClassListItem::ClassListItem(ClassFlags flags)
    : kind_(Kind::Flags), flags_(std::move(flags)) {}

std::string join_class_names(const std::vector<ClassListItem>& items) {
    std::vector<std::string> names;

    for (const auto& item : items) {
        switch (item.kind()) {
            case ClassListItem::Kind::Null:
                break;
            case ClassListItem::Kind::Name:
                names.push_back(item.name());
                break;
            case ClassListItem::Kind::List:
                names.push_back(join_class_names(item.list()));
                break;
            case ClassListItem::Kind::Flags:
                for (const auto& [name, enabled] : item.flags()) {
                    if (enabled) names.push_back(name);
                }
                break;
        }
    }

    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) result += ' ';
        result += names[i];
    }
    return result;
}

} // namespace freestyle::css
