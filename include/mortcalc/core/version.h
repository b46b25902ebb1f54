#pragma once

namespace mortcalc::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "1.0";

// kServiceName is reported by the health endpoint and the Server header.
constexpr const char* kServiceName = "mortgage-calculator";

}  // namespace mortcalc::core
