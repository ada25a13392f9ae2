#pragma once
#include <freestyle/cache/ref_counted_cache.h>
#include <string>
#include <variant>

namespace freestyle::css {

class Style;
class AtRule;

// Everything a Container can hold.
using RuleNode = std::variant<Style, AtRule>;

// A fully resolved selector such as ".f1x2 .foo". Leaf node.
class Selector {
public:
    explicit Selector(std::string selector);

    const std::string& id() const { return id_; }
    const std::string& selector() const { return selector_; }

private:
    std::string selector_;
    std::string id_;
};

// A declaration block shared by every selector that compiles to the same
// declaration text.
class Style {
public:
    explicit Style(std::string declarations);

    const std::string& id() const { return id_; }
    const std::string& declarations() const { return declarations_; }

    cache::RefCountedCache<Selector>& selectors() { return selectors_; }
    const cache::RefCountedCache<Selector>& selectors() const { return selectors_; }

    // "<sel>,<sel>{<declarations>}", or "" when there are no declarations.
    std::string render() const;

private:
    std::string declarations_;
    std::string id_;
    cache::RefCountedCache<Selector> selectors_;
};

class Container {
public:
    cache::RefCountedCache<RuleNode>& rules() { return rules_; }
    const cache::RefCountedCache<RuleNode>& rules() const { return rules_; }

    // Children rendered back to back in insertion order.
    std::string render() const;

private:
    cache::RefCountedCache<RuleNode> rules_;
};

// An at-rule block such as "@media (min-width: 500px)". Its body holds the
// hoisted rules of every registration nested under the same rule text.
class AtRule {
public:
    explicit AtRule(std::string rule);

    const std::string& id() const { return id_; }
    const std::string& rule() const { return rule_; }

    Container& body() { return body_; }
    const Container& body() const { return body_; }

    std::string render() const;

private:
    std::string rule_;
    std::string id_;
    Container body_;
};

const std::string& cache_key(const Selector& selector);
const std::string& cache_key(const RuleNode& node);

std::string render(const RuleNode& node);

} // namespace freestyle::css
