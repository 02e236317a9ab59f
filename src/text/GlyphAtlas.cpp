#include "kl/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace kl {

GlyphAtlas::GlyphAtlas() {
  setAtlasSize(atlasSize_);
}

void GlyphAtlas::setAtlasSize(std::uint32_t s) {
  atlasSize_ = s;
  atlas_.assign(static_cast<std::size_t>(s) * s, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
}

void GlyphAtlas::setGlyphPx(std::uint32_t px) {
  if (px == 0 || px == glyphPx_) return;
  glyphPx_ = px;
  setAtlasSize(atlasSize_);
  if (fontLoaded_) initMetrics();
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);
  fontLoaded_ = initMetrics();
  setAtlasSize(atlasSize_);
  return fontLoaded_;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: cannot open font '%s'\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

bool GlyphAtlas::initMetrics() {
  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }
  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);
  ascent_ = static_cast<float>(asc) * scale;
  descent_ = static_cast<float>(desc) * scale;
  return true;
}

bool GlyphAtlas::ensureAscii() {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c = 32; c <= 126; c++) cp.push_back(c);
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }

  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    std::uint32_t cp = codepoints[i];
    if (glyphs_.find(cp) != glyphs_.end()) continue;

    int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0, iy0, ix1, iy1;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    int gw = ix1 - ix0;
    int gh = iy1 - iy0;

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;
    info.bearingX = static_cast<float>(ix0);
    info.bearingY = static_cast<float>(-iy0);

    if (gw <= 0 || gh <= 0) {
      // Whitespace glyph: metrics only
      glyphs_[cp] = info;
      continue;
    }

    std::uint32_t cellW = static_cast<std::uint32_t>(gw) + pad_ * 2;
    std::uint32_t cellH = static_cast<std::uint32_t>(gh) + pad_ * 2;
    std::uint32_t ax, ay;
    if (!packGlyph(cellW, cellH, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas: atlas full (cp=%u)\n", cp);
      continue;
    }

    // Rasterize straight into the atlas cell.
    std::uint8_t* dst = &atlas_[static_cast<std::size_t>(ay + pad_) * atlasSize_ + ax + pad_];
    stbtt_MakeGlyphBitmap(&font, dst, gw, gh, static_cast<int>(atlasSize_), scale, scale, glyphIdx);

    info.atlasX = ax + pad_;
    info.atlasY = ay + pad_;
    info.w = static_cast<std::uint32_t>(gw);
    info.h = static_cast<std::uint32_t>(gh);
    glyphs_[cp] = info;
    modified = true;
  }

  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.x + w <= atlasSize_ - 1 && shelf.y + h <= atlasSize_ - 1) {
      if (shelf.h == 0) shelf.h = h;
      if (h <= shelf.h) {
        outX = shelf.x;
        outY = shelf.y;
        shelf.x += w;
        return true;
      }
    }
  }

  // New shelf
  auto& last = shelves_.back();
  std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

} // namespace kl
