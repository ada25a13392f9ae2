#pragma once
#include <freestyle/cache/ref_counted_cache.h>
#include <freestyle/core/diagnostics.h>
#include <freestyle/css/class_names.h>
#include <freestyle/css/style_nodes.h>
#include <freestyle/css/style_value.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace freestyle {

// Top-level registration surface. A sheet has no content of its own to hash,
// so its id comes from the factory that created it.
class StyleSheet {
public:
    using Listener = cache::RefCountedCache<css::RuleNode>::Listener;

    explicit StyleSheet(uint32_t instance_id);

    // Listeners installed by set_diagnostics() point back at this sheet.
    StyleSheet(const StyleSheet&) = delete;
    StyleSheet& operator=(const StyleSheet&) = delete;

    uint32_t instance_id() const { return instance_id_; }
    const std::string& id() const { return id_; }

    // Returns the generated class name.
    std::string register_style(const css::StyleLayer& styles);
    // Undoes one register_style() call made with an identical tree.
    std::string unregister_style(const css::StyleLayer& styles);

    // The CSS text of every live rule.
    std::string render() const;

    // Drops every top-level rule, one remove event each.
    void clear();

    css::Container& container() { return container_; }
    const css::Container& container() const { return container_; }

    cache::ListenerId add_change_listener(Listener listener);
    bool remove_change_listener(cache::ListenerId id);

    // Mirrors registrations and top-level cache changes into `diagnostics`.
    // Passing nullptr detaches.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics);

    std::string url(std::string_view input) const;
    std::string join(const std::vector<css::ClassListItem>& items) const;

private:
    void emit_diagnostic(const std::string& module, const std::string& stage,
                         const std::string& message) const;

    uint32_t instance_id_;
    std::string id_;
    css::Container container_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    cache::ListenerId diagnostics_listener_ = 0;
};

// Hands out style sheets with ids 1, 2, 3, ...
class StyleSheetFactory {
public:
    std::unique_ptr<StyleSheet> create();
    uint32_t created() const { return next_id_; }

private:
    uint32_t next_id_ = 0;
};

} // namespace freestyle
