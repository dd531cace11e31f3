#include <folio-cpp/plugin.hpp>
#include <folio-cpp/editor_state.hpp>

#include <atomic>

namespace folio_cpp {

namespace {

auto next_key_id() -> std::uint64_t {
    static auto counter = std::atomic<std::uint64_t>{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

auto create_key(std::string_view name) -> std::string {
    return std::string{name} + "$" + std::to_string(next_key_id());
}

}  // namespace

PluginKeyBase::PluginKeyBase(std::string_view name) : key_{create_key(name)} {}

auto PluginKeyBase::get(const EditorState& state) const -> const Plugin* {
    return state.find_plugin(key_);
}

Plugin::Plugin(PluginSpec spec)
    : spec_{std::make_shared<const PluginSpec>(std::move(spec))},
      key_{spec_->key ? spec_->key->key() : create_key("plugin")} {}

}  // namespace folio_cpp
