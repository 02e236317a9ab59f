// D5.1: PluginManager install/uninstall, hook order, isolation and reentrancy

#include "kl/chart/Chart.hpp"
#include "kl/core/Scheduler.hpp"
#include "support/RecordingSurface.hpp"

#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static kl::ChartOptions optionsFor(kl::DrawingSurface& surface, kl::Scheduler& scheduler) {
  kl::ChartOptions o;
  o.surface = &surface;
  o.scheduler = &scheduler;
  return o;
}

int main() {
  kltest::RecordingSurface surface;
  kl::ManualScheduler scheduler;

  // --- Install, duplicate and empty names ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    int installs = 0;
    kl::Chart* seen = nullptr;
    kl::Plugin p;
    p.name = "alpha";
    p.onInstall = [&](kl::Chart& c) { installs++; seen = &c; };
    requireTrue(chart.installPlugin(p), "install alpha");
    requireTrue(installs == 1 && seen == &chart, "onInstall got the chart");
    requireTrue(chart.renderPending(), "install schedules a frame");
    scheduler.runFrame();
    requireTrue(!chart.installPlugin(p), "duplicate rejected");
    requireTrue(installs == 1, "duplicate onInstall not called");

    kl::Plugin unnamed;
    requireTrue(!chart.installPlugin(unnamed), "empty name rejected");
    requireTrue(!chart.renderPending(), "rejected installs draw nothing");

    requireTrue(chart.plugins().hasPlugin("alpha"), "hasPlugin");
    requireTrue(chart.plugins().getPlugin("alpha") != nullptr, "getPlugin");
    requireTrue(chart.plugins().getPlugin("beta") == nullptr, "getPlugin unknown");
    requireTrue(!chart.uninstallPlugin("beta"), "uninstall unknown fails");
    requireTrue(!chart.renderPending(), "failed uninstall draws nothing");
    requireTrue(chart.uninstallPlugin("alpha"), "uninstall alpha");
    requireTrue(chart.renderPending(), "uninstall schedules a frame");
    std::printf("  install PASS\n");
  }

  // --- Hooks run per phase in install order ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    std::vector<std::string> log;
    for (const char* name : {"first", "second"}) {
      kl::Plugin p;
      p.name = name;
      std::string n = name;
      p.onRender = [&log, n](const kl::PluginContext& ctx) {
        log.push_back(n + ":" + kl::renderPhaseName(ctx.phase));
        requireTrue(ctx.surface != nullptr && ctx.layout != nullptr && ctx.chart != nullptr,
                    "context populated");
      };
      chart.installPlugin(p);
    }
    chart.renderNow();
    requireTrue(log.size() == 10, "5 phases x 2 plugins");
    requireTrue(log[0] == "first:before-render", "first phase, first plugin");
    requireTrue(log[1] == "second:before-render", "first phase, second plugin");
    requireTrue(log[2] == "first:after-grid", "after-grid");
    requireTrue(log[4] == "first:after-axes", "after-axes");
    requireTrue(log[6] == "first:after-candles", "after-candles");
    requireTrue(log[9] == "second:after-render", "last hook");
    std::printf("  phase order PASS\n");
  }

  // --- A throwing plugin does not stop the others ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    int healthy = 0;
    kl::Plugin bad;
    bad.name = "bad";
    bad.onRender = [](const kl::PluginContext&) { throw std::runtime_error("boom"); };
    bad.onEvent = [](const kl::ChartEvent&) { throw std::runtime_error("boom"); };
    kl::Plugin good;
    good.name = "good";
    good.onRender = [&](const kl::PluginContext&) { healthy++; };
    good.onEvent = [&](const kl::ChartEvent&) { healthy += 100; };
    chart.installPlugin(bad);
    chart.installPlugin(good);
    chart.renderNow();
    requireTrue(healthy == 5, "good plugin ran in every phase");
    kl::ChartEvent ev;
    ev.type = kl::EventType::Click;
    chart.handleEvent(ev);
    requireTrue(healthy == 105, "good plugin got the event");
    requireTrue(chart.plugins().size() == 2, "bad plugin stays installed");

    kl::Plugin failing;
    failing.name = "failing";
    failing.onInstall = [](kl::Chart&) { throw std::runtime_error("no"); };
    requireTrue(!chart.installPlugin(failing), "failed onInstall rejected");
    requireTrue(!chart.plugins().hasPlugin("failing"), "failed plugin not kept");
    std::printf("  isolation PASS\n");
  }

  // --- Uninstall from inside a hook ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    int victimRenders = 0, victimUninstalls = 0;
    kl::Plugin killer;
    killer.name = "killer";
    killer.onRender = [&](const kl::PluginContext& ctx) {
      if (ctx.phase == kl::RenderPhase::AfterGrid) ctx.chart->uninstallPlugin("victim");
    };
    kl::Plugin victim;
    victim.name = "victim";
    victim.onRender = [&](const kl::PluginContext&) { victimRenders++; };
    victim.onUninstall = [&](kl::Chart&) { victimUninstalls++; };
    chart.installPlugin(killer);
    chart.installPlugin(victim);
    chart.renderNow();
    requireTrue(victimRenders == 1, "victim only saw before-render");
    requireTrue(victimUninstalls == 1, "onUninstall once");
    requireTrue(chart.installedPlugins().size() == 1, "one plugin left");
    requireTrue(chart.installedPlugins()[0] == "killer", "killer left");
    std::printf("  uninstall during hook PASS\n");
  }

  // --- Plugins installed during a hook wait for the next pass ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    int lateCalls = 0;
    bool added = false;
    kl::Plugin spawner;
    spawner.name = "spawner";
    spawner.onRender = [&](const kl::PluginContext& ctx) {
      if (added) return;
      added = true;
      kl::Plugin late;
      late.name = "late";
      late.onRender = [&](const kl::PluginContext&) { lateCalls++; };
      ctx.chart->installPlugin(late);
    };
    chart.installPlugin(spawner);
    chart.renderNow();
    // Installed during before-render; runs from after-grid onwards.
    requireTrue(lateCalls == 4, "late plugin joined at the next phase");
    std::printf("  install during hook PASS\n");
  }

  // --- Plugins see raw canvas coordinates ---
  {
    kl::Chart chart(optionsFor(surface, scheduler));
    double gotX = -1, gotY = -1;
    kl::Plugin p;
    p.name = "listener";
    p.onEvent = [&](const kl::ChartEvent& ev) { gotX = ev.chartX; gotY = ev.chartY; };
    chart.installPlugin(p);
    kl::ChartEvent ev;
    ev.type = kl::EventType::PointerMove;
    ev.chartX = 100;
    ev.chartY = 50;
    chart.handleEvent(ev);
    requireTrue(gotX == 100 && gotY == 50, "raw coordinates");
    std::printf("  event dispatch PASS\n");
  }

  // --- Destruction uninstalls in reverse order ---
  {
    std::vector<std::string> order;
    {
      kl::Chart chart(optionsFor(surface, scheduler));
      for (const char* name : {"a", "b", "c"}) {
        kl::Plugin p;
        p.name = name;
        std::string n = name;
        p.onUninstall = [&order, n](kl::Chart&) { order.push_back(n); };
        chart.installPlugin(p);
      }
    }
    requireTrue(order.size() == 3 && order[0] == "c" && order[2] == "a", "reverse uninstall");
    std::printf("  teardown PASS\n");
  }

  std::printf("\nD5.1 plugin manager PASS\n");
  return 0;
}
