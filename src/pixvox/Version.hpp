#pragma once

#include <string>

// Build/version metadata for PixVox.
//
// CMake defines these macros for every target through pixvox_core's PUBLIC compile
// definitions. The fallbacks keep the header usable from IDEs and ad-hoc builds.

#ifndef PIXVOX_VERSION_MAJOR
#define PIXVOX_VERSION_MAJOR 0
#endif

#ifndef PIXVOX_VERSION_MINOR
#define PIXVOX_VERSION_MINOR 0
#endif

#ifndef PIXVOX_VERSION_PATCH
#define PIXVOX_VERSION_PATCH 0
#endif

#ifndef PIXVOX_VERSION_STRING
#define PIXVOX_VERSION_STRING "0.0.0"
#endif

#ifndef PIXVOX_GIT_SHA
#define PIXVOX_GIT_SHA "unknown"
#endif

namespace pixvox {

inline constexpr const char* PixVoxVersionString()
{
  return PIXVOX_VERSION_STRING;
}

inline std::string PixVoxFullVersionString()
{
  std::string s = PixVoxVersionString();
  const std::string sha = PIXVOX_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace pixvox
