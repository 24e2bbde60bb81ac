// File Overview: Declares the boot-time loader that applies factory-provisioned NVS
// overrides on top of the compiled-in FoxConfig defaults.
#pragma once
#include "FoxConfig.hpp"

namespace ConfigStore {
  // Reads the "fox" namespace read-only (missing keys keep their defaults) and
  // clamps the result. Returns true when the namespace existed.
  bool load(FoxConfig& cfg);

  // One-line summary for the boot log
  void logSummary(const FoxConfig& cfg);
}
