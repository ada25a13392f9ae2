#include <freestyle/css/style_nodes.h>
#include <freestyle/core/config.h>
#include <freestyle/hash/hasher.h>

namespace freestyle::css {

namespace {

std::string make_id(char prefix, const std::string& content) {
    return prefix + hash::hash_string(content);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Selector
// ---------------------------------------------------------------------------

Selector::Selector(std::string selector)
    : selector_(std::move(selector)),
      id_(make_id(core::config::kSelectorIdPrefix, selector_)) {}

// ---------------------------------------------------------------------------
// Style
// ---------------------------------------------------------------------------

Style::Style(std::string declarations)
    : declarations_(std::move(declarations)),
      id_(make_id(core::config::kStyleIdPrefix, declarations_)) {}

std::string Style::render() const {
    if (declarations_.empty()) return "";

    std::string result;
    bool first = true;
    for (const auto& selector : selectors_.values()) {
        if (!first) result += ',';
        result += selector->selector();
        first = false;
    }
    result += '{';
    result += declarations_;
    result += '}';
    return result;
}

// ---------------------------------------------------------------------------
// Container
// ---------------------------------------------------------------------------

std::string Container::render() const {
    std::string result;
    for (const auto& node : rules_.values()) {
        result += css::render(*node);
    }
    return result;
}

// ---------------------------------------------------------------------------
// AtRule
// ---------------------------------------------------------------------------

AtRule::AtRule(std::string rule)
    : rule_(std::move(rule)),
      id_(make_id(core::config::kAtRuleIdPrefix, rule_)) {}

std::string AtRule::render() const {
    return rule_ + "{" + body_.render() + "}";
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

const std::string& cache_key(const Selector& selector) {
    return selector.id();
}

const std::string& cache_key(const RuleNode& node) {
    return std::visit([](const auto& n) -> const std::string& { return n.id(); }, node);
}

std::string render(const RuleNode& node) {
    return std::visit([](const auto& n) { return n.render(); }, node);
}

} // namespace freestyle::css
