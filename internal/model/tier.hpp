#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace cic::model {

/*
  Refresh cadence of a probe.

  Every probe belongs to exactly one tier; the tier decides the TTL of the
  probe's cache entry.
*/
enum class Tier : std::uint8_t {
  kFast    = 0,
  kMedium  = 1,
  kSlow    = 2,
  kGlacial = 3,
};

constexpr std::string_view ToString(Tier tier) {
  switch (tier) {
    case Tier::kFast:
      return "fast";
    case Tier::kMedium:
      return "medium";
    case Tier::kSlow:
      return "slow";
    case Tier::kGlacial:
      return "glacial";
    default:
      return "unknown";
  }
}

constexpr std::chrono::seconds DefaultTtl(Tier tier) {
  switch (tier) {
    case Tier::kFast:
      return std::chrono::seconds(30);
    case Tier::kMedium:
      return std::chrono::seconds(120);
    case Tier::kSlow:
      return std::chrono::seconds(300);
    case Tier::kGlacial:
    default:
      return std::chrono::seconds(900);
  }
}

} // namespace cic::model
