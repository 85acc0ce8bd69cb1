#pragma once

#include <string>

namespace cic::db::model {

/*
  Rows of the lookup caches. One row per IP, replaced on every refresh.
*/

struct DnsRecord {
  std::string ip;
  std::string hostname;
  double      resolved_at = 0.0;
};

struct GeoRecord {
  std::string ip;
  std::string country_code;
  std::string city;
  std::string isp;
  double      resolved_at = 0.0;
};

struct AttackerScanRecord {
  std::string ip;
  std::string open_ports;
  std::string os_guess;
  double      scanned_at = 0.0;
};

} // namespace cic::db::model
