#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kl {

// Image export for top-down RGBA8 framebuffers.

// Encode as PNG (RGBA, 8 bit). Self-contained encoder using stored deflate
// blocks. Returns an empty vector for an empty image.
std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height);

bool writePNG(const std::string& path, const std::uint8_t* rgba, int width, int height);

// Binary PPM (P6, alpha dropped).
bool writePPM(const std::string& path, const std::uint8_t* rgba, int width, int height);

// CRC-32 (ISO 3309) as used by PNG chunks.
std::uint32_t crc32(const std::uint8_t* data, std::size_t len);

} // namespace kl
