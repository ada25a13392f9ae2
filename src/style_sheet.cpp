#include <freestyle/style_sheet.h>
#include <freestyle/css/tree_builder.h>
#include <freestyle/hash/hasher.h>
#include <freestyle/url/percent_encoding.h>

namespace freestyle {

StyleSheet::StyleSheet(uint32_t instance_id)
    : instance_id_(instance_id), id_(hash::hash_to_string(instance_id)) {}

std::string StyleSheet::register_style(const css::StyleLayer& styles) {
    css::TreeBuilder builder(container_);
    std::string class_name = builder.register_styles(styles);
    emit_diagnostic("registry", "register", class_name);
    return class_name;
}

std::string StyleSheet::unregister_style(const css::StyleLayer& styles) {
    css::TreeBuilder builder(container_);
    std::string class_name = builder.unregister_styles(styles);
    emit_diagnostic("registry", "unregister", class_name);
    return class_name;
}

std::string StyleSheet::render() const {
    return container_.render();
}

void StyleSheet::clear() {
    container_.rules().clear();
    emit_diagnostic("registry", "clear", "sheet " + id_ + " emptied");
}

cache::ListenerId StyleSheet::add_change_listener(Listener listener) {
    return container_.rules().add_change_listener(std::move(listener));
}

bool StyleSheet::remove_change_listener(cache::ListenerId id) {
    return container_.rules().remove_change_listener(id);
}

void StyleSheet::set_diagnostics(core::DiagnosticEmitter* diagnostics) {
    if (diagnostics_listener_ != 0) {
        container_.rules().remove_change_listener(diagnostics_listener_);
        diagnostics_listener_ = 0;
    }

    diagnostics_ = diagnostics;
    if (diagnostics_ == nullptr) return;

    diagnostics_listener_ = container_.rules().add_change_listener(
        [this](cache::CacheEvent event, const css::RuleNode& node) {
            emit_diagnostic("cache", cache::cache_event_name(event), css::cache_key(node));
        });
}

std::string StyleSheet::url(std::string_view input) const {
    return url::css_url(input);
}

std::string StyleSheet::join(const std::vector<css::ClassListItem>& items) const {
    return css::join_class_names(items);
}

void StyleSheet::emit_diagnostic(const std::string& module, const std::string& stage,
                                 const std::string& message) const {
    if (diagnostics_ == nullptr) return;
    diagnostics_->emit(core::Severity::Info, module, stage, message, instance_id_);
}

std::unique_ptr<StyleSheet> StyleSheetFactory::create() {
    return std::make_unique<StyleSheet>(++next_id_);
}

} // namespace freestyle
