// D9.1: RasterSurface pixels, state stack, dashing and image export

#include "kl/export/Snapshot.hpp"
#include "kl/render/RasterSurface.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool pixelIs(const kl::RasterSurface& s, int x, int y,
                    int r, int g, int b, int a) {
  auto p = s.pixel(x, y);
  return p[0] == r && p[1] == g && p[2] == b && p[3] == a;
}

int main() {
  const float red[4]   = {1, 0, 0, 1};
  const float blue[4]  = {0, 0, 1, 1};
  const float green[4] = {0, 1, 0, 1};
  const float white[4] = {1, 1, 1, 1};
  const float black[4] = {0, 0, 0, 1};

  // --- Clear and fill ---
  {
    kl::RasterSurface s(20, 10);
    requireTrue(s.width() == 20 && s.height() == 10, "size");
    requireTrue(s.pixels().size() == 20u * 10u * 4u, "buffer size");
    requireTrue(pixelIs(s, 0, 0, 0, 0, 0, 0), "starts transparent");

    s.setClearColor(red);
    s.clear();
    requireTrue(pixelIs(s, 19, 9, 255, 0, 0, 255), "cleared to red");

    s.fillRect(2, 2, 3, 3, blue);
    requireTrue(pixelIs(s, 3, 3, 0, 0, 255, 255), "inside fill");
    requireTrue(pixelIs(s, 1, 1, 255, 0, 0, 255), "outside fill");
    requireTrue(pixelIs(s, 5, 5, 255, 0, 0, 255), "fill is half-open");
    requireTrue(pixelIs(s, -1, 0, 0, 0, 0, 0), "out of bounds reads zero");
    std::printf("  clear/fill PASS\n");
  }

  // --- Partial coverage and global alpha ---
  {
    kl::RasterSurface s(4, 4);
    s.fillRect(0, 0, 0.5, 1, white);
    requireTrue(pixelIs(s, 0, 0, 255, 255, 255, 128), "half-covered pixel");

    s.setClearColor(black);
    s.clear();
    s.setGlobalAlpha(0.5);
    s.fillRect(0, 0, 1, 1, white);
    requireTrue(pixelIs(s, 0, 0, 128, 128, 128, 255), "alpha blended over black");
    s.setGlobalAlpha(3.0);
    s.fillRect(1, 0, 1, 1, white);
    requireTrue(pixelIs(s, 1, 0, 255, 255, 255, 255), "alpha clamps to 1");
    std::printf("  coverage PASS\n");
  }

  // --- Clip, translate, save/restore ---
  {
    kl::RasterSurface s(10, 10);
    s.save();
    s.setClip(0, 0, 5, 5);
    s.fillRect(0, 0, 10, 10, green);
    requireTrue(s.saveDepth() == 1, "one saved state");
    s.restore();
    requireTrue(s.saveDepth() == 0, "stack empty");
    requireTrue(pixelIs(s, 4, 4, 0, 255, 0, 255), "inside clip");
    requireTrue(pixelIs(s, 7, 7, 0, 0, 0, 0), "outside clip");

    s.save();
    s.translate(6, 6);
    s.fillRect(0, 0, 1, 1, red);
    s.restore();
    s.fillRect(0, 9, 1, 1, blue);
    requireTrue(pixelIs(s, 6, 6, 255, 0, 0, 255), "translated fill");
    requireTrue(pixelIs(s, 0, 9, 0, 0, 255, 255), "translation restored");

    // Clip is relative to the current translation and only narrows.
    s.save();
    s.translate(5, 0);
    s.setClip(0, 0, 5, 2);
    s.setClip(-5, 0, 20, 20);
    s.fillRect(-5, 0, 20, 20, white);
    s.restore();
    requireTrue(pixelIs(s, 6, 1, 255, 255, 255, 255), "inside nested clip");
    requireTrue(pixelIs(s, 2, 1, 0, 255, 0, 255), "left of clip untouched");
    requireTrue(pixelIs(s, 6, 6, 255, 0, 0, 255), "below clip untouched");

    s.restore(); // unbalanced restore is a no-op
    requireTrue(s.saveDepth() == 0, "still empty");
    std::printf("  state PASS\n");
  }

  // --- Strokes ---
  {
    kl::RasterSurface s(20, 10);
    s.beginPath();
    s.moveTo(0, 5.5);
    s.lineTo(20, 5.5);
    s.stroke(white, 1.0);
    requireTrue(pixelIs(s, 10, 5, 255, 255, 255, 255), "solid line");
    requireTrue(pixelIs(s, 10, 4, 0, 0, 0, 0), "line is one pixel high");

    s.resize(20, 10);
    s.setLineDash({4, 4});
    s.beginPath();
    s.moveTo(0, 5.5);
    s.lineTo(20, 5.5);
    s.stroke(white, 1.0);
    requireTrue(pixelIs(s, 1, 5, 255, 255, 255, 255), "first dash");
    requireTrue(pixelIs(s, 5, 5, 0, 0, 0, 0), "first gap");
    requireTrue(pixelIs(s, 9, 5, 255, 255, 255, 255), "second dash");

    s.resize(20, 10);
    s.setLineDash({4, -1}); // invalid: solid
    s.beginPath();
    s.moveTo(0, 2.5);
    s.lineTo(20, 2.5);
    s.stroke(white, 1.0);
    requireTrue(pixelIs(s, 5, 2, 255, 255, 255, 255), "invalid dash draws solid");

    s.resize(20, 10);
    s.beginPath();
    s.moveTo(2, 2);
    s.lineTo(2, 2);
    s.stroke(white, 0.0);
    requireTrue(pixelIs(s, 2, 2, 0, 0, 0, 0), "zero width draws nothing");

    s.strokeRect(2, 2, 6, 4, green, 1.0);
    requireTrue(pixelIs(s, 4, 2, 0, 255, 0, 128), "edge straddles the outline");
    requireTrue(pixelIs(s, 4, 4, 0, 0, 0, 0), "stroked rect is hollow");
    std::printf("  strokes PASS\n");
  }

  // --- Text without a font ---
  {
    kl::RasterSurface s(10, 10);
    requireTrue(!s.glyphs().hasFont(), "no font");
    requireTrue(std::fabs(s.measureText("abcd", 10) - 24.0) < 1e-9, "fallback width");
    s.drawText("abcd", 0, 5, white, 10);
    bool blank = true;
    for (auto b : s.pixels()) blank = blank && b == 0;
    requireTrue(blank, "text without font draws nothing");
    requireTrue(!s.loadFontFile("/nonexistent/font.ttf"), "missing font file");
    std::printf("  text PASS\n");
  }

  // --- Export ---
  {
    const char* check = "123456789";
    requireTrue(kl::crc32(reinterpret_cast<const std::uint8_t*>(check), 9) == 0xCBF43926u,
                "crc32 check value");

    kl::RasterSurface s(3, 2);
    s.setClearColor(blue);
    s.clear();
    auto png = kl::encodePNG(s.pixels().data(), s.width(), s.height());
    const std::uint8_t sig[8] = {137, 80, 78, 71, 13, 10, 26, 10};
    requireTrue(png.size() > 8 && std::memcmp(png.data(), sig, 8) == 0, "png signature");
    requireTrue(std::memcmp(png.data() + 12, "IHDR", 4) == 0, "IHDR first");
    requireTrue(png[19] == 3 && png[23] == 2, "dimensions big-endian");
    requireTrue(std::memcmp(png.data() + png.size() - 8, "IEND", 4) == 0, "IEND last");
    requireTrue(kl::encodePNG(nullptr, 0, 0).empty(), "empty image");

    requireTrue(!s.savePNG("/nonexistent/dir/out.png"), "unwritable path");
    requireTrue(!s.savePPM("/nonexistent/dir/out.ppm"), "unwritable ppm path");
    std::printf("  export PASS\n");
  }

  std::printf("\nD9.1 raster surface PASS\n");
  return 0;
}
