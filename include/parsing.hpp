#pragma once

#include <optional>
#include <string>

namespace cavegeo
{

  std::string trim(const std::string &text);

  /** Strict decimal parse of a whole (trimmed) string. Rejects empty, trailing junk and non-finite values. */
  std::optional<double> parse_number(const std::string &text);

}
