#include "geo_locator.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "http_client.hpp"
#include "internal/observability/logging.hpp"
#include "ip_address.hpp"

namespace cic::lookup {

using cic::observability::StringField;

namespace {

std::string Field(const google::protobuf::Struct& doc, const std::string& key) {
  auto it = doc.fields().find(key);
  if (it == doc.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return {};
  return it->second.string_value();
}

} // namespace

GeoLocator::GeoLocator(std::shared_ptr<db::MetricsRepository> repository,
                       std::shared_ptr<RateLimiter>           limiter,
                       std::chrono::seconds                   ttl,
                       Fetcher                                fetcher)
    : repository_(std::move(repository)), limiter_(std::move(limiter)), ttl_(ttl), fetcher_(std::move(fetcher)) {
}

GeoInfo GeoLocator::Locate(const std::string& ip, util::TimePoint now) {
  if (!IsIpLiteral(ip)) {
    CIC_LOG_WARN("Rejected geolocation of non-IP input", {StringField("input", ip)});
    return GeoInfo{};
  }

  {
    auto tx     = repository_->BeginRead();
    auto cached = repository_->GetGeo(*tx, ip);
    tx->Commit();

    if (cached && util::ToUnixSeconds(now) - cached->resolved_at < static_cast<double>(ttl_.count())) {
      return GeoInfo{cached->country_code, cached->city, cached->isp};
    }
  }

  limiter_->Acquire();

  auto info = fetcher_(ip);
  if (!info) {
    CIC_LOG_DEBUG("Geolocation failed", {StringField("ip", ip)});
    return GeoInfo{};
  }

  db::model::GeoRecord row;
  row.ip           = ip;
  row.country_code = info->country_code;
  row.city         = info->city;
  row.isp          = info->isp;
  row.resolved_at  = util::ToUnixSeconds(now);

  auto tx = repository_->Begin();
  auto r  = repository_->UpsertGeo(*tx, row);
  if (r) {
    tx->Commit();
  } else {
    CIC_LOG_WARN("Failed to cache geolocation", {StringField("ip", ip), StringField("error", r.message)});
  }

  return *info;
}

GeoLocator::Fetcher GeoLocator::HttpFetcher(std::string endpoint, std::chrono::milliseconds timeout) {
  return [endpoint = std::move(endpoint), timeout](const std::string& ip) -> std::optional<GeoInfo> {
    auto response = HttpGet(endpoint + ip + "?fields=status,country,countryCode,city,isp", timeout);
    if (!response.ok) {
      CIC_LOG_DEBUG("Geolocation request failed", {StringField("ip", ip), StringField("error", response.error)});
      return std::nullopt;
    }
    return ParseResponse(response.body);
  };
}

std::optional<GeoInfo> GeoLocator::ParseResponse(const std::string& body) {
  google::protobuf::Struct doc;
  if (!google::protobuf::util::JsonStringToMessage(body, &doc).ok()) return std::nullopt;

  if (Field(doc, "status") == "fail") return std::nullopt;

  GeoInfo info;
  info.country_code = Field(doc, "countryCode");
  info.city         = Field(doc, "city");
  info.isp          = Field(doc, "isp");

  if (info.country_code.empty()) return std::nullopt;
  return info;
}

} // namespace cic::lookup
