#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kl {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // Top-left of the glyph bitmap in the atlas (pixels).
  std::uint32_t atlasX{0}, atlasY{0};
  // Metrics in pixels at the atlas glyph size.
  float advance{0};
  float bearingX{0}, bearingY{0}; // bearingY: baseline to bitmap top (positive up)
  std::uint32_t w{0}, h{0};
};

// Alpha-coverage glyph cache rasterized with stb_truetype and packed into a
// single R8 atlas by a shelf packer.
class GlyphAtlas {
public:
  GlyphAtlas();

  // Load a TTF/OTF from memory.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& path);

  bool hasFont() const { return fontLoaded_; }

  // Ensure glyphs for a set of codepoints are rasterized and packed.
  // Returns true if the atlas was modified.
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);

  // Convenience: ensure ASCII printable (32..126).
  bool ensureAscii();

  // Lookup glyph info. Returns nullptr if not rasterized.
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Atlas R8 pixel data.
  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  // Rasterization size; changing it drops cached glyphs.
  void setGlyphPx(std::uint32_t px);
  std::uint32_t glyphPx() const { return glyphPx_; }
  void setAtlasSize(std::uint32_t s);

  // Vertical metrics at glyphPx (ascent positive, descent negative).
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }

private:
  bool initMetrics();
  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  std::uint32_t atlasSize_{512};
  std::uint32_t glyphPx_{32};
  std::uint32_t pad_{1};

  std::vector<std::uint8_t> atlas_;    // R8 atlas (atlasSize_ x atlasSize_)
  std::vector<std::uint8_t> fontData_; // retained font file bytes
  bool fontLoaded_{false};
  float ascent_{0};
  float descent_{0};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  // Shelf packer state
  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;
};

} // namespace kl
