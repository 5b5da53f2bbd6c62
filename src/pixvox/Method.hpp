#pragma once

#include <cstdint>
#include <string>

namespace pixvox {

// Closed set of conversion methods.
//
// Height/Color/Structure name a single converter; All fans out to the three of them.
enum class ConvertMethod : std::uint8_t {
  Height = 0,
  Color = 1,
  Structure = 2,
  All = 3,
};

// Parse a user-facing method name (case-insensitive).
// Accepts "height", "color" (or "colour"), "structure", "all".
bool ParseConvertMethod(const std::string& s, ConvertMethod& outMethod);

// Stable lowercase name ("height", "color", "structure", "all").
const char* ConvertMethodName(ConvertMethod m);

// True for the values a caller may legally pass in (guards casts from integers).
inline bool IsKnownConvertMethod(ConvertMethod m)
{
  return static_cast<std::uint8_t>(m) <= static_cast<std::uint8_t>(ConvertMethod::All);
}

} // namespace pixvox
