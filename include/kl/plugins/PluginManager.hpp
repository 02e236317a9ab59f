#pragma once
#include "kl/plugins/Plugin.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace kl {

// Installed plugins in installation order. Hooks run in that order.
// Plugins may install or uninstall plugins from inside a hook: removed
// entries stop receiving calls immediately, added ones start with the next
// dispatch. A hook that throws is logged and skipped.
class PluginManager {
public:
  explicit PluginManager(Chart& chart) : chart_(chart) {}

  PluginManager(const PluginManager&) = delete;
  PluginManager& operator=(const PluginManager&) = delete;

  // False (with a diagnostic) for an empty or duplicate name.
  bool install(Plugin plugin);

  // False (with a diagnostic) for an unknown name.
  bool uninstall(const std::string& name);

  // Uninstalls everything, last installed first.
  void uninstallAll();

  void executeHooks(const PluginContext& ctx);
  void dispatchEvent(const ChartEvent& event);

  bool hasPlugin(const std::string& name) const;
  const Plugin* getPlugin(const std::string& name) const;
  std::vector<std::string> pluginNames() const;
  std::size_t size() const;

private:
  struct Entry {
    Plugin plugin;
    bool alive{true};
  };

  std::shared_ptr<Entry> find(const std::string& name) const;
  void sweep();

  Chart& chart_;
  std::vector<std::shared_ptr<Entry>> entries_;
  int depth_{0};
};

} // namespace kl
