#include "kl/config/ChartConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace kl {

namespace {

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Field readers: absent -> true and untouched; wrong type -> false + error.

bool readNumber(const rapidjson::Value& obj, const char* key, const std::string& path,
                double& out, std::string& error) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber()) {
    error = path + key + ": expected a number";
    return false;
  }
  out = v.GetDouble();
  return true;
}

bool readPositive(const rapidjson::Value& obj, const char* key, const std::string& path,
                  double& out, std::string& error) {
  double v = out;
  if (!readNumber(obj, key, path, v, error)) return false;
  if (obj.HasMember(key) && !(v > 0.0)) {
    error = path + key + ": must be positive";
    return false;
  }
  out = v;
  return true;
}

bool readNonNegative(const rapidjson::Value& obj, const char* key, const std::string& path,
                     double& out, std::string& error) {
  double v = out;
  if (!readNumber(obj, key, path, v, error)) return false;
  if (obj.HasMember(key) && v < 0.0) {
    error = path + key + ": must not be negative";
    return false;
  }
  out = v;
  return true;
}

bool readInt64(const rapidjson::Value& obj, const char* key, const std::string& path,
               std::int64_t& out, std::string& error) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsInt64()) {
    error = path + key + ": expected an integer";
    return false;
  }
  out = v.GetInt64();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, const std::string& path,
              bool& out, std::string& error) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsBool()) {
    error = path + key + ": expected true or false";
    return false;
  }
  out = v.GetBool();
  return true;
}

bool readColor(const rapidjson::Value& obj, const char* key, const std::string& path,
               float out[4], std::string& error) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsString() || !parseHexColor(v.GetString(), out)) {
    error = path + key + ": expected a color like \"#rrggbb\"";
    return false;
  }
  return true;
}

bool readTheme(const rapidjson::Value& v, Theme& theme, std::string& error) {
  if (v.IsString()) {
    auto preset = themeByName(v.GetString());
    if (!preset) {
      error = std::string("theme: unknown preset '") + v.GetString() + "'";
      return false;
    }
    theme = *preset;
    return true;
  }
  if (!v.IsObject()) {
    error = "theme: expected a preset name or an object";
    return false;
  }

  const std::string p = "theme.";
  if (v.HasMember("preset")) {
    if (!v["preset"].IsString()) {
      error = "theme.preset: expected a string";
      return false;
    }
    auto preset = themeByName(v["preset"].GetString());
    if (!preset) {
      error = std::string("theme.preset: unknown preset '") + v["preset"].GetString() + "'";
      return false;
    }
    theme = *preset;
  }
  if (v.HasMember("name")) {
    if (!v["name"].IsString()) {
      error = "theme.name: expected a string";
      return false;
    }
    theme.name = v["name"].GetString();
  }

  double fontPx = theme.fontPx;
  double paddingPx = theme.paddingPx;
  double highlightOpacity = theme.highlightOpacity;
  bool ok = readColor(v, "background", p, theme.backgroundColor, error) &&
            readColor(v, "candleUp", p, theme.candleUp, error) &&
            readColor(v, "candleDown", p, theme.candleDown, error) &&
            readColor(v, "grid", p, theme.gridColor, error) &&
            readColor(v, "axisLine", p, theme.axisLineColor, error) &&
            readColor(v, "label", p, theme.labelColor, error) &&
            readColor(v, "text", p, theme.textColor, error) &&
            readColor(v, "crosshair", p, theme.crosshairColor, error) &&
            readColor(v, "highlight", p, theme.highlightColor, error) &&
            readColor(v, "volumeUp", p, theme.volumeUp, error) &&
            readColor(v, "volumeDown", p, theme.volumeDown, error) &&
            readColor(v, "tooltipBackground", p, theme.tooltipBackground, error) &&
            readColor(v, "tooltipBorder", p, theme.tooltipBorder, error) &&
            readColor(v, "tooltipText", p, theme.tooltipText, error) &&
            readPositive(v, "fontSize", p, fontPx, error) &&
            readNonNegative(v, "padding", p, paddingPx, error) &&
            readNonNegative(v, "highlightOpacity", p, highlightOpacity, error);
  if (!ok) return false;
  if (highlightOpacity > 1.0) {
    error = "theme.highlightOpacity: must be within [0, 1]";
    return false;
  }
  theme.fontPx = static_cast<float>(fontPx);
  theme.paddingPx = static_cast<float>(paddingPx);
  theme.highlightOpacity = static_cast<float>(highlightOpacity);
  return true;
}

bool readInteraction(const rapidjson::Value& v, InteractionOptions& io, std::string& error) {
  if (!v.IsObject()) {
    error = "interaction: expected an object";
    return false;
  }
  const std::string p = "interaction.";
  if (!readBool(v, "enablePan", p, io.enablePan, error) ||
      !readBool(v, "enableZoom", p, io.enableZoom, error) ||
      !readBool(v, "enableCrosshair", p, io.enableCrosshair, error) ||
      !readPositive(v, "minVisibleBars", p, io.minVisibleBars, error) ||
      !readPositive(v, "maxVisibleBars", p, io.maxVisibleBars, error) ||
      !readPositive(v, "zoomSpeed", p, io.zoomSpeed, error)) {
    return false;
  }
  if (io.minVisibleBars > io.maxVisibleBars) {
    error = "interaction.minVisibleBars: exceeds maxVisibleBars";
    return false;
  }
  if (v.HasMember("wheelMode")) {
    const auto& m = v["wheelMode"];
    auto mode = m.IsString() ? parseWheelMode(m.GetString()) : std::nullopt;
    if (!mode) {
      error = "interaction.wheelMode: expected \"zoomX\", \"scrollX\" or \"blend\"";
      return false;
    }
    io.wheelMode = *mode;
  }
  return true;
}

bool readRandomWalk(const rapidjson::Value& v, RandomWalkConfig& rw, std::string& error) {
  if (!v.IsObject()) {
    error = "randomWalk: expected an object";
    return false;
  }
  const std::string p = "randomWalk.";
  if (!readPositive(v, "initialPrice", p, rw.initialPrice, error) ||
      !readNonNegative(v, "volatility", p, rw.volatility, error) ||
      !readInt64(v, "intervalMs", p, rw.intervalMs, error) ||
      !readInt64(v, "candleDurationMs", p, rw.candleDurationMs, error) ||
      !readNonNegative(v, "baseVolume", p, rw.baseVolume, error)) {
    return false;
  }
  if (rw.intervalMs <= 0 || rw.candleDurationMs <= 0) {
    error = rw.intervalMs <= 0 ? "randomWalk.intervalMs: must be positive"
                               : "randomWalk.candleDurationMs: must be positive";
    return false;
  }
  if (v.HasMember("seed")) {
    if (!v["seed"].IsUint()) {
      error = "randomWalk.seed: expected an unsigned integer";
      return false;
    }
    rw.seed = v["seed"].GetUint();
  }
  return true;
}

bool readPlayback(const rapidjson::Value& v, ArrayPlaybackConfig& pb, std::string& error) {
  if (!v.IsObject()) {
    error = "playback: expected an object";
    return false;
  }
  const std::string p = "playback.";
  if (!readPositive(v, "speed", p, pb.speed, error) ||
      !readBool(v, "loop", p, pb.loop, error)) {
    return false;
  }
  if (v.HasMember("fixedIntervalMs")) {
    std::int64_t ms = 0;
    if (!readInt64(v, "fixedIntervalMs", p, ms, error)) return false;
    if (ms < 0) {
      error = "playback.fixedIntervalMs: must not be negative";
      return false;
    }
    pb.fixedIntervalMs = ms;
  }
  return true;
}

} // anonymous namespace

bool parseHexColor(const std::string& text, float out[4]) {
  if (text.size() != 7 && text.size() != 9) return false;
  if (text[0] != '#') return false;

  float rgba[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  std::size_t channels = (text.size() - 1) / 2;
  for (std::size_t i = 0; i < channels; i++) {
    int hi = hexDigit(text[1 + i * 2]);
    int lo = hexDigit(text[2 + i * 2]);
    if (hi < 0 || lo < 0) return false;
    rgba[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }
  for (int i = 0; i < 4; i++) out[i] = rgba[i];
  return true;
}

bool loadChartConfig(const std::string& json, ChartConfig& out, std::string& error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "parse error at offset %zu: %s",
                  doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
    error = buf;
    return false;
  }
  if (!doc.IsObject()) {
    error = "top level: expected an object";
    return false;
  }

  // Stage into a copy so a failure leaves `out` untouched.
  ChartConfig cfg = out;
  const std::string root;
  if (!readPositive(doc, "width", root, cfg.width, error) ||
      !readPositive(doc, "height", root, cfg.height, error) ||
      !readNonNegative(doc, "priceAxisWidth", root, cfg.priceAxisWidth, error) ||
      !readNonNegative(doc, "timeAxisHeight", root, cfg.timeAxisHeight, error) ||
      !readNonNegative(doc, "volumeHeight", root, cfg.volumeHeight, error)) {
    return false;
  }

  if (doc.HasMember("theme") && !readTheme(doc["theme"], cfg.theme, error)) return false;
  if (doc.HasMember("interaction") && !readInteraction(doc["interaction"], cfg.interaction, error))
    return false;
  if (doc.HasMember("randomWalk") && !readRandomWalk(doc["randomWalk"], cfg.randomWalk, error))
    return false;
  if (doc.HasMember("playback") && !readPlayback(doc["playback"], cfg.playback, error))
    return false;

  if (doc.HasMember("font")) {
    if (!doc["font"].IsString()) {
      error = "font: expected a file path";
      return false;
    }
    cfg.fontPath = doc["font"].GetString();
  }

  out = cfg;
  return true;
}

bool loadChartConfigFile(const std::string& path, ChartConfig& out, std::string& error) {
  std::ifstream f(path);
  if (!f) {
    error = "cannot open '" + path + "'";
    std::fprintf(stderr, "ChartConfig: %s\n", error.c_str());
    return false;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  return loadChartConfig(ss.str(), out, error);
}

} // namespace kl
