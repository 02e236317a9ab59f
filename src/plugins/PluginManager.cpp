#include "kl/plugins/PluginManager.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

namespace kl {

const char* renderPhaseName(RenderPhase phase) {
  switch (phase) {
    case RenderPhase::BeforeRender: return "before-render";
    case RenderPhase::AfterGrid:    return "after-grid";
    case RenderPhase::AfterAxes:    return "after-axes";
    case RenderPhase::AfterCandles: return "after-candles";
    case RenderPhase::AfterRender:  return "after-render";
  }
  return "unknown";
}

std::shared_ptr<PluginManager::Entry> PluginManager::find(const std::string& name) const {
  for (const auto& e : entries_) {
    if (e->alive && e->plugin.name == name) return e;
  }
  return nullptr;
}

bool PluginManager::install(Plugin plugin) {
  if (plugin.name.empty()) {
    std::fprintf(stderr, "PluginManager: refusing plugin with empty name\n");
    return false;
  }
  if (find(plugin.name)) {
    std::fprintf(stderr, "PluginManager: plugin '%s' is already installed\n", plugin.name.c_str());
    return false;
  }

  auto entry = std::make_shared<Entry>();
  entry->plugin = std::move(plugin);
  entries_.push_back(entry);

  if (entry->plugin.onInstall) {
    try {
      entry->plugin.onInstall(chart_);
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "PluginManager: '%s' onInstall failed: %s\n",
                   entry->plugin.name.c_str(), ex.what());
      entry->alive = false;
      if (depth_ == 0) sweep();
      return false;
    }
  }
  return true;
}

bool PluginManager::uninstall(const std::string& name) {
  auto entry = find(name);
  if (!entry) {
    std::fprintf(stderr, "PluginManager: plugin '%s' is not installed\n", name.c_str());
    return false;
  }

  entry->alive = false;
  if (entry->plugin.onUninstall) {
    try {
      entry->plugin.onUninstall(chart_);
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "PluginManager: '%s' onUninstall failed: %s\n", name.c_str(), ex.what());
    }
  }
  if (depth_ == 0) sweep();
  return true;
}

void PluginManager::uninstallAll() {
  auto names = pluginNames();
  for (auto it = names.rbegin(); it != names.rend(); ++it) uninstall(*it);
}

void PluginManager::executeHooks(const PluginContext& ctx) {
  std::size_t count = entries_.size();
  depth_++;
  for (std::size_t i = 0; i < count; i++) {
    std::shared_ptr<Entry> e = entries_[i];
    if (!e->alive || !e->plugin.onRender) continue;
    try {
      e->plugin.onRender(ctx);
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "PluginManager: '%s' onRender(%s) failed: %s\n",
                   e->plugin.name.c_str(), renderPhaseName(ctx.phase), ex.what());
    }
  }
  depth_--;
  if (depth_ == 0) sweep();
}

void PluginManager::dispatchEvent(const ChartEvent& event) {
  std::size_t count = entries_.size();
  depth_++;
  for (std::size_t i = 0; i < count; i++) {
    std::shared_ptr<Entry> e = entries_[i];
    if (!e->alive || !e->plugin.onEvent) continue;
    try {
      e->plugin.onEvent(event);
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "PluginManager: '%s' onEvent(%s) failed: %s\n",
                   e->plugin.name.c_str(), eventTypeName(event.type), ex.what());
    }
  }
  depth_--;
  if (depth_ == 0) sweep();
}

void PluginManager::sweep() {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const std::shared_ptr<Entry>& e) { return !e->alive; }),
                 entries_.end());
}

bool PluginManager::hasPlugin(const std::string& name) const {
  return find(name) != nullptr;
}

const Plugin* PluginManager::getPlugin(const std::string& name) const {
  auto e = find(name);
  return e ? &e->plugin : nullptr;
}

std::vector<std::string> PluginManager::pluginNames() const {
  std::vector<std::string> names;
  for (const auto& e : entries_) {
    if (e->alive) names.push_back(e->plugin.name);
  }
  return names;
}

std::size_t PluginManager::size() const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const std::shared_ptr<Entry>& e) { return e->alive; }));
}

} // namespace kl
