#include "kl/export/Snapshot.hpp"

#include <algorithm>
#include <array>
#include <cstdio>

namespace kl {

namespace {

std::array<std::uint32_t, 256> makeCrcTable() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t n = 0; n < 256; n++) {
    std::uint32_t c = n;
    for (int k = 0; k < 8; k++) {
      c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    }
    table[n] = c;
  }
  return table;
}

std::uint32_t adler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t MOD = 65521u;
  constexpr std::size_t NMAX = 5552; // max bytes before the sums can overflow
  std::uint32_t a = 1, b = 0;
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t chunk = std::min(len - offset, NMAX);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[offset + i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    offset += chunk;
  }
  return (b << 16) | a;
}

void pushBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void writeChunk(std::vector<std::uint8_t>& out, const char type[4],
                const std::uint8_t* data, std::size_t dataLen) {
  pushBE32(out, static_cast<std::uint32_t>(dataLen));
  std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  if (dataLen > 0 && data) out.insert(out.end(), data, data + dataLen);
  // CRC covers type + data
  pushBE32(out, crc32(&out[typeStart], 4 + dataLen));
}

// Stored (uncompressed) deflate blocks in a zlib wrapper.
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& raw) {
  std::vector<std::uint8_t> z;
  std::size_t blocks = (raw.size() + 65534) / 65535;
  z.reserve(2 + blocks * 5 + raw.size() + 4);

  z.push_back(0x78); // deflate, 32K window
  z.push_back(0x01);

  std::size_t offset = 0;
  while (offset < raw.size()) {
    std::size_t blockLen = std::min<std::size_t>(raw.size() - offset, 65535);
    bool last = offset + blockLen == raw.size();
    z.push_back(last ? 0x01 : 0x00);
    auto len16 = static_cast<std::uint16_t>(blockLen);
    auto nlen16 = static_cast<std::uint16_t>(~len16);
    z.push_back(static_cast<std::uint8_t>(len16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len16 >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen16 >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(offset),
             raw.begin() + static_cast<std::ptrdiff_t>(offset + blockLen));
    offset += blockLen;
  }

  pushBE32(z, adler32(raw.data(), raw.size()));
  return z;
}

bool writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "Snapshot: cannot open '%s' for writing\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  std::fclose(f);
  return written == bytes.size();
}

} // anonymous namespace

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  static const std::array<std::uint32_t, 256> table = makeCrcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height) {
  std::vector<std::uint8_t> out;
  if (!rgba || width <= 0 || height <= 0) return out;

  static const std::uint8_t kSignature[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), kSignature, kSignature + 8);

  std::vector<std::uint8_t> ihdr;
  pushBE32(ihdr, static_cast<std::uint32_t>(width));
  pushBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(6); // color type: RGBA
  ihdr.push_back(0); // deflate
  ihdr.push_back(0); // adaptive filtering
  ihdr.push_back(0); // no interlace
  writeChunk(out, "IHDR", ihdr.data(), ihdr.size());

  // Filter byte 0 (None) per row.
  std::size_t rowBytes = static_cast<std::size_t>(width) * 4;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(height) * (rowBytes + 1));
  for (int y = 0; y < height; y++) {
    raw.push_back(0x00);
    const std::uint8_t* row = rgba + static_cast<std::size_t>(y) * rowBytes;
    raw.insert(raw.end(), row, row + rowBytes);
  }

  auto idat = zlibStored(raw);
  writeChunk(out, "IDAT", idat.data(), idat.size());
  writeChunk(out, "IEND", nullptr, 0);
  return out;
}

bool writePNG(const std::string& path, const std::uint8_t* rgba, int width, int height) {
  auto bytes = encodePNG(rgba, width, height);
  if (bytes.empty()) return false;
  return writeFile(path, bytes);
}

bool writePPM(const std::string& path, const std::uint8_t* rgba, int width, int height) {
  if (!rgba || width <= 0 || height <= 0) return false;

  char header[64];
  int n = std::snprintf(header, sizeof(header), "P6\n%d %d\n255\n", width, height);
  std::vector<std::uint8_t> bytes(header, header + n);
  std::size_t pixels = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  bytes.reserve(bytes.size() + pixels * 3);
  for (std::size_t i = 0; i < pixels; i++) {
    bytes.push_back(rgba[i * 4 + 0]);
    bytes.push_back(rgba[i * 4 + 1]);
    bytes.push_back(rgba[i * 4 + 2]);
  }
  return writeFile(path, bytes);
}

} // namespace kl
