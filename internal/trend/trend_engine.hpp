#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/metrics_repository.hpp"
#include "internal/util/time.hpp"

namespace cic::trend {

enum class TrendArrow : std::uint8_t {
  kNoData = 0,
  kUp,
  kDown,
  kStable,
};

// Glyph shown by the renderer.
constexpr std::string_view ToString(TrendArrow arrow) {
  switch (arrow) {
    case TrendArrow::kUp:
      return "↑";
    case TrendArrow::kDown:
      return "↓";
    case TrendArrow::kStable:
      return "→";
    case TrendArrow::kNoData:
    default:
      return "--";
  }
}

// Relative change under 5% (or absolute change under 0.5 when past <= 0) is
// stable. Missing values yield kNoData.
TrendArrow CompareTrend(std::optional<double> current, std::optional<double> past);

struct TrendSample {
  std::optional<double> current;
  std::optional<double> past;
  TrendArrow            arrow = TrendArrow::kNoData;
};

struct ServerTrends {
  TrendSample cpu;
  TrendSample mem;
  TrendSample disk;
};

// Per-agent rates plus the "_total" aggregate.
inline constexpr const char* kTotalKey = "_total";
using TokensPerHour                    = std::map<std::string, int64_t>;

using AgentTokenTrends = std::map<std::string, TrendArrow>;

/*
  TrendEngine

  Derived views over the stored history. Stateless apart from the repository;
  every call reads in its own transaction.
*/
class TrendEngine {
 public:
  static constexpr std::chrono::seconds kWindow{3600};

  explicit TrendEngine(std::shared_ptr<db::MetricsRepository> repository);

  // Latest server sample vs the latest one at or before now - 1h.
  ServerTrends GetServerTrends(util::TimePoint now) const;

  // Earliest sample in [now - 1h, now] vs the latest sample of each agent.
  TokensPerHour GetAgentTokensPerHour(util::TimePoint now) const;

  AgentTokenTrends GetAgentTokenTrends(util::TimePoint now) const;

 private:
  std::shared_ptr<db::MetricsRepository> repository_;
};

} // namespace cic::trend
