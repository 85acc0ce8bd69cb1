#pragma once

#include <string>

namespace cic::lookup {

// True for a literal IPv4 or IPv6 address. Host names, ranges and anything
// carrying shell or nmap syntax are rejected.
bool IsIpLiteral(const std::string& text);

} // namespace cic::lookup
