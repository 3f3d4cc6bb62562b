#pragma once

namespace ftr::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace ftr::core
