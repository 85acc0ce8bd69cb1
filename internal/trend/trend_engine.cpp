#include "trend_engine.hpp"

#include <cmath>

namespace cic::trend {

namespace {

constexpr double kStableRatio    = 0.05;
constexpr double kStableAbsolute = 0.5;

TrendSample MakeSample(double current, double past) {
  TrendSample s;
  s.current = current;
  s.past    = past;
  s.arrow   = CompareTrend(current, past);
  return s;
}

} // namespace

TrendArrow CompareTrend(std::optional<double> current, std::optional<double> past) {
  if (!current || !past) return TrendArrow::kNoData;

  const double diff = *current - *past;

  if (*past > 0) {
    if (std::abs(diff) / *past < kStableRatio) return TrendArrow::kStable;
  } else if (std::abs(diff) < kStableAbsolute) {
    return TrendArrow::kStable;
  }

  if (diff > 0) return TrendArrow::kUp;
  if (diff < 0) return TrendArrow::kDown;
  return TrendArrow::kStable;
}

TrendEngine::TrendEngine(std::shared_ptr<db::MetricsRepository> repository) : repository_(std::move(repository)) {
}

// ------------------------------------------------------------------
// Server
// ------------------------------------------------------------------

ServerTrends TrendEngine::GetServerTrends(util::TimePoint now) const {
  ServerTrends trends;

  auto tx      = repository_->BeginRead();
  auto current = repository_->LatestServerSample(*tx);
  auto past    = current ? repository_->ServerSampleAtOrBefore(*tx, util::ToUnixSeconds(now - kWindow)) : std::nullopt;
  tx->Commit();

  if (!current || !past) return trends;

  trends.cpu  = MakeSample(current->cpu_percent, past->cpu_percent);
  trends.mem  = MakeSample(current->mem_used_mb, past->mem_used_mb);
  trends.disk = MakeSample(current->disk_used_gb, past->disk_used_gb);
  return trends;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

TokensPerHour TrendEngine::GetAgentTokensPerHour(util::TimePoint now) const {
  TokensPerHour result;
  int64_t       total = 0;

  const double since = util::ToUnixSeconds(now - kWindow);

  auto tx = repository_->BeginRead();
  for (const auto& name : repository_->AgentNamesSince(*tx, since)) {
    auto earliest = repository_->EarliestAgentSampleSince(*tx, name, since);
    auto latest   = repository_->LatestAgentSample(*tx, name);

    int64_t rate = 0;
    if (earliest && latest && latest->timestamp > earliest->timestamp) {
      const int64_t tokens = latest->tokens_used - earliest->tokens_used;
      const double  hours  = (latest->timestamp - earliest->timestamp) / 3600.0;
      if (hours > 0 && tokens >= 0) {
        rate = static_cast<int64_t>(static_cast<double>(tokens) / hours);
      }
    }

    result[name] = rate;
    total += rate;
  }
  tx->Commit();

  result[kTotalKey] = total;
  return result;
}

AgentTokenTrends TrendEngine::GetAgentTokenTrends(util::TimePoint now) const {
  AgentTokenTrends result;

  const double cutoff = util::ToUnixSeconds(now - kWindow);

  auto tx = repository_->BeginRead();
  for (const auto& name : repository_->AgentNamesSince(*tx, cutoff)) {
    auto current = repository_->LatestAgentSample(*tx, name);
    auto past    = repository_->AgentSampleAtOrBefore(*tx, name, cutoff);

    std::optional<double> c, p;
    if (current) c = static_cast<double>(current->tokens_used);
    if (past) p = static_cast<double>(past->tokens_used);

    result[name] = CompareTrend(c, p);
  }
  tx->Commit();

  return result;
}

} // namespace cic::trend
