#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/model/tier.hpp"
#include "internal/util/errors.hpp"

namespace cic::config {

using cic::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultIntervalSec         = 30;
constexpr uint32_t kDefaultProbeTimeoutMs      = 10000;
constexpr uint32_t kDefaultSecurityTimeoutMs   = 15000;
constexpr uint64_t kDefaultRetentionSec        = 30ull * 24 * 3600;
constexpr uint32_t kDefaultMaxTargets          = 5;
constexpr uint32_t kDefaultDnsTtlSec           = 24 * 3600;
constexpr uint32_t kDefaultGeoTtlSec           = 7 * 24 * 3600;
constexpr uint32_t kDefaultScanTtlSec          = 6 * 3600;
constexpr uint32_t kDefaultDnsTimeoutMs        = 5000;
constexpr uint32_t kDefaultGeoTimeoutMs        = 5000;
constexpr uint32_t kDefaultScanTimeoutMs       = 15000;
constexpr uint32_t kDefaultGeoMinIntervalMs    = 1000;
constexpr const char* kDefaultDatabasePath     = "~/.cic/metrics.db";
constexpr const char* kDefaultGeoEndpoint      = "http://ip-api.com/json/";
constexpr const char* kDefaultAgentCli         = "openclaw";
constexpr const char* kDefaultAgentLogDir      = "~/.openclaw/logs";
constexpr const char* kDefaultAuthLogPath      = "/var/log/auth.log";

uint32_t Seconds(model::Tier tier) {
  return static_cast<uint32_t>(model::DefaultTtl(tier).count());
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid "all defaults" config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* collector = config.mutable_collector();
  if (collector->interval_sec() == 0) collector->set_interval_sec(kDefaultIntervalSec);
  if (collector->probe_timeout_ms() == 0) collector->set_probe_timeout_ms(kDefaultProbeTimeoutMs);
  if (collector->security_probe_timeout_ms() == 0) collector->set_security_probe_timeout_ms(kDefaultSecurityTimeoutMs);

  auto* tiers = collector->mutable_tiers();
  if (tiers->fast_sec() == 0) tiers->set_fast_sec(Seconds(model::Tier::kFast));
  if (tiers->medium_sec() == 0) tiers->set_medium_sec(Seconds(model::Tier::kMedium));
  if (tiers->slow_sec() == 0) tiers->set_slow_sec(Seconds(model::Tier::kSlow));
  if (tiers->glacial_sec() == 0) tiers->set_glacial_sec(Seconds(model::Tier::kGlacial));

  auto* database = config.mutable_database();
  if (database->path().empty()) database->set_path(kDefaultDatabasePath);
  database->set_path(ExpandHome(database->path()));
  if (database->retention_sec() == 0) database->set_retention_sec(kDefaultRetentionSec);

  auto* enrichment = config.mutable_enrichment();
  if (enrichment->max_targets() == 0) enrichment->set_max_targets(kDefaultMaxTargets);
  if (enrichment->dns_ttl_sec() == 0) enrichment->set_dns_ttl_sec(kDefaultDnsTtlSec);
  if (enrichment->geo_ttl_sec() == 0) enrichment->set_geo_ttl_sec(kDefaultGeoTtlSec);
  if (enrichment->scan_ttl_sec() == 0) enrichment->set_scan_ttl_sec(kDefaultScanTtlSec);
  if (enrichment->dns_timeout_ms() == 0) enrichment->set_dns_timeout_ms(kDefaultDnsTimeoutMs);
  if (enrichment->geo_timeout_ms() == 0) enrichment->set_geo_timeout_ms(kDefaultGeoTimeoutMs);
  if (enrichment->scan_timeout_ms() == 0) enrichment->set_scan_timeout_ms(kDefaultScanTimeoutMs);
  if (enrichment->geo_endpoint().empty()) enrichment->set_geo_endpoint(kDefaultGeoEndpoint);
  if (enrichment->geo_min_interval_ms() == 0) enrichment->set_geo_min_interval_ms(kDefaultGeoMinIntervalMs);

  auto* agent_service = config.mutable_agent_service();
  if (agent_service->cli().empty()) agent_service->set_cli(kDefaultAgentCli);
  if (agent_service->log_dir().empty()) agent_service->set_log_dir(kDefaultAgentLogDir);
  agent_service->set_log_dir(ExpandHome(agent_service->log_dir()));
  if (agent_service->auth_log_path().empty()) agent_service->set_auth_log_path(kDefaultAuthLogPath);

  auto* logging = config.mutable_logging();
  logging->set_file(ExpandHome(logging->file()));
}

std::string ConfigLoader::ExpandHome(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path;
  }

  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    throw util::ConfigError("cannot expand '~' in path without HOME: " + path);
  }
  return std::string(home) + path.substr(1);
}

} // namespace cic::config
