#include "ip_address.hpp"

#include <arpa/inet.h>

namespace cic::lookup {

bool IsIpLiteral(const std::string& text) {
  if (text.empty() || text.size() > 45) return false;

  unsigned char buf[16];
  return inet_pton(AF_INET, text.c_str(), buf) == 1 || inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

} // namespace cic::lookup
