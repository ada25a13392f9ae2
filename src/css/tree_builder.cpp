#include <freestyle/css/tree_builder.h>
#include <freestyle/core/config.h>
#include <freestyle/css/property_compiler.h>
#include <freestyle/css/selector_interpolator.h>
#include <freestyle/hash/hasher.h>
#include <utility>

namespace freestyle::css {

namespace {

uint32_t mix_layer(uint32_t current, const std::string& selector,
                   const std::string& declarations) {
    // Selector before declarations: the hash depends on where a block sits,
    // not only on which blocks exist.
    current = hash::hash(selector, current);
    return hash::hash(declarations, current);
}

std::string class_selector(const std::string& class_name) {
    return core::config::kClassSelectorPrefix + class_name;
}

} // anonymous namespace

TreeBuilder::TreeBuilder(Container& container) : container_(container) {}

std::string TreeBuilder::register_styles(const StyleLayer& styles) {
    BuildState state = stylize(container_, styles, core::config::kRootSelector, BuildState{});

    std::string class_name = hash::hash_to_string(state.hash);
    std::string parent = class_selector(class_name);

    for (const auto& registration : state.styles) {
        // Keys prefixed 'n' only ever hold Style nodes.
        auto& style = std::get<Style>(*registration.style);
        style.selectors().add(
            std::make_shared<Selector>(interpolate(registration.selector, parent)));
    }

    return class_name;
}

std::string TreeBuilder::unregister_styles(const StyleLayer& styles) {
    BuildState state = replay(&container_, styles, core::config::kRootSelector, BuildState{});

    std::string class_name = hash::hash_to_string(state.hash);
    std::string parent = class_selector(class_name);

    for (const auto& registration : state.styles) {
        auto& style = std::get<Style>(*registration.style);
        style.selectors().remove(Selector(interpolate(registration.selector, parent)));
    }

    // Undo in reverse so nested rules leave before the at-rule holding them.
    for (auto it = state.rules.rbegin(); it != state.rules.rend(); ++it) {
        it->container->rules().remove(*it->node);
    }

    return class_name;
}

BuildState TreeBuilder::stylize(Container& container, const StyleLayer& styles,
                                const std::string& selector, BuildState state) {
    ParsedLayer parsed = parse_style_layer(styles);
    std::string declarations = compile_properties(parsed.properties);

    auto style = container.rules().add(
        std::make_shared<RuleNode>(std::in_place_type<Style>, declarations));
    state.rules.push_back({&container, style});
    state.styles.push_back({selector, style});
    state.hash = mix_layer(state.hash, selector, declarations);

    for (const auto& nested : parsed.nested_styles) {
        if (is_at_rule(nested.key)) {
            auto at_rule = container.rules().add(
                std::make_shared<RuleNode>(std::in_place_type<AtRule>, nested.key));
            state.rules.push_back({&container, at_rule});
            // At-rules hoist the block, the selector stays the same.
            state = stylize(std::get<AtRule>(*at_rule).body(), nested.value.layer(),
                            selector, std::move(state));
        } else {
            state = stylize(container, nested.value.layer(),
                            interpolate(nested.key, selector), std::move(state));
        }
    }

    return state;
}

BuildState TreeBuilder::replay(Container* container, const StyleLayer& styles,
                               const std::string& selector, BuildState state) const {
    ParsedLayer parsed = parse_style_layer(styles);
    std::string declarations = compile_properties(parsed.properties);

    // A null container means the enclosing at-rule is not registered; the
    // walk continues only to keep the hash in step.
    if (container != nullptr) {
        Style probe(declarations);
        if (auto style = container->rules().find(probe.id())) {
            state.rules.push_back({container, style});
            state.styles.push_back({selector, style});
        }
    }
    state.hash = mix_layer(state.hash, selector, declarations);

    for (const auto& nested : parsed.nested_styles) {
        if (is_at_rule(nested.key)) {
            Container* body = nullptr;
            if (container != nullptr) {
                AtRule probe(nested.key);
                if (auto at_rule = container->rules().find(probe.id())) {
                    state.rules.push_back({container, at_rule});
                    body = &std::get<AtRule>(*at_rule).body();
                }
            }
            state = replay(body, nested.value.layer(), selector, std::move(state));
        } else {
            state = replay(container, nested.value.layer(),
                           interpolate(nested.key, selector), std::move(state));
        }
    }

    return state;
}

} // namespace freestyle::css
