#pragma once
#include <freestyle/css/style_nodes.h>
#include <freestyle/css/style_value.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace freestyle::css {

// A compiled layer waiting for its final selector.
struct StyleRegistration {
    std::string selector;   // relative to "&", e.g. "& .foo"
    std::shared_ptr<RuleNode> style;
};

// A rule node a walk added to (or, when replaying, found in) a container.
struct RuleRegistration {
    Container* container = nullptr;
    std::shared_ptr<RuleNode> node;
};

// Accumulator threaded through the recursive walk.
struct BuildState {
    uint32_t hash = 0;
    std::vector<StyleRegistration> styles;
    std::vector<RuleRegistration> rules;
};

// Compiles user style trees into a container's node hierarchy.
//
// register_styles() walks the tree pre-order, adding one Style per layer
// and one AtRule per at-rule key, chaining the hash over (selector,
// declarations) pairs. The final hash is the class name, and each Style
// then receives its selector resolved against ".<class name>".
//
// Registrations are undone by replaying the identical tree through
// unregister_styles(), which removes exactly what register_styles() added.
class TreeBuilder {
public:
    explicit TreeBuilder(Container& container);

    std::string register_styles(const StyleLayer& styles);
    std::string unregister_styles(const StyleLayer& styles);

private:
    BuildState stylize(Container& container, const StyleLayer& styles,
                       const std::string& selector, BuildState state);
    BuildState replay(Container* container, const StyleLayer& styles,
                      const std::string& selector, BuildState state) const;

    Container& container_;
};

} // namespace freestyle::css
