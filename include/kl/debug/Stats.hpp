#pragma once
#include <cstddef>
#include <cstdint>

namespace kl {

struct FrameStats {
  // Frames
  std::uint64_t framesRendered = 0;
  double lastFrameMs = 0.0;

  // Scheduling
  std::uint64_t renderRequests = 0;
  std::uint64_t coalescedRequests = 0; // requests absorbed by a pending frame

  // Content of the last frame
  std::size_t visibleCandles = 0;
};

} // namespace kl
