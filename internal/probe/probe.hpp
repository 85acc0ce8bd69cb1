#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/bundles.hpp"
#include "internal/model/tier.hpp"

namespace cic::probe {

enum class ProbeErrorCode : std::uint8_t {
  kOk = 0,
  kTimeout,
  kCommandFailed,
  kMalformedOutput,
  kUnavailable,
  kException,
};

constexpr std::string_view ToString(ProbeErrorCode code) {
  switch (code) {
    case ProbeErrorCode::kOk:
      return "ok";
    case ProbeErrorCode::kTimeout:
      return "timeout";
    case ProbeErrorCode::kCommandFailed:
      return "command_failed";
    case ProbeErrorCode::kMalformedOutput:
      return "malformed_output";
    case ProbeErrorCode::kUnavailable:
      return "unavailable";
    case ProbeErrorCode::kException:
      return "exception";
    default:
      return "unknown";
  }
}

struct ProbeResult {
  ProbeErrorCode               code = ProbeErrorCode::kOk;
  std::string                  message;
  std::optional<model::Bundle> bundle;

  static ProbeResult Ok(model::Bundle b) {
    ProbeResult r;
    r.bundle = std::move(b);
    return r;
  }

  static ProbeResult Err(ProbeErrorCode c, std::string msg = {}) {
    ProbeResult r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ProbeErrorCode::kOk && bundle.has_value();
  }
};

struct ProbeDescriptor {
  std::string               name;
  model::Tier               tier = model::Tier::kFast;
  std::chrono::seconds      ttl{30};
  std::chrono::milliseconds timeout{10000};
};

/*
  One named data source.

  Collect() runs on a scheduler thread and may block up to the descriptor's
  timeout. Implementations must be safe to call from a thread other than the
  one that constructed them.
*/
class Probe {
 public:
  virtual ~Probe() = default;

  virtual const ProbeDescriptor& Descriptor() const = 0;

  virtual ProbeResult Collect() = 0;
};

// Holds the descriptor for concrete probes.
class ProbeBase : public Probe {
 public:
  explicit ProbeBase(ProbeDescriptor descriptor) : descriptor_(std::move(descriptor)) {
  }

  const ProbeDescriptor& Descriptor() const override {
    return descriptor_;
  }

 protected:
  ProbeDescriptor descriptor_;
};

// Probe backed by a callable.
class FunctionProbe final : public Probe {
 public:
  using Fn = std::function<ProbeResult()>;

  FunctionProbe(ProbeDescriptor descriptor, Fn fn) : descriptor_(std::move(descriptor)), fn_(std::move(fn)) {
  }

  const ProbeDescriptor& Descriptor() const override {
    return descriptor_;
  }

  ProbeResult Collect() override {
    return fn_();
  }

 private:
  ProbeDescriptor descriptor_;
  Fn              fn_;
};

} // namespace cic::probe
