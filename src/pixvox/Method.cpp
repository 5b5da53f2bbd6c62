#include "pixvox/Method.hpp"

#include <cctype>

namespace pixvox {

bool ParseConvertMethod(const std::string& s, ConvertMethod& outMethod)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "height") {
    outMethod = ConvertMethod::Height;
    return true;
  }
  if (t == "color" || t == "colour") {
    outMethod = ConvertMethod::Color;
    return true;
  }
  if (t == "structure") {
    outMethod = ConvertMethod::Structure;
    return true;
  }
  if (t == "all") {
    outMethod = ConvertMethod::All;
    return true;
  }
  return false;
}

const char* ConvertMethodName(ConvertMethod m)
{
  switch (m) {
  case ConvertMethod::Height: return "height";
  case ConvertMethod::Color: return "color";
  case ConvertMethod::Structure: return "structure";
  case ConvertMethod::All: return "all";
  default: return "unknown";
  }
}

} // namespace pixvox
