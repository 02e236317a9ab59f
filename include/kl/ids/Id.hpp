#pragma once
#include <cstdint>

namespace kl {

// Handles are plain integers. Zero is never issued.
using Id = std::uint64_t;

using ListenerId = Id;
using SubscriptionId = Id;
using TimerId = Id;
using SeriesId = Id;

inline constexpr Id kInvalidId = 0;

} // namespace kl
