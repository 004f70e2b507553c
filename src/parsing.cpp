#include "parsing.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace cavegeo
{

  std::string trim(const std::string &text)
  {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
      ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
      --end;
    return text.substr(begin, end - begin);
  }

  std::optional<double> parse_number(const std::string &text)
  {
    std::string trimmed = trim(text);
    if (trimmed.empty())
      return std::nullopt;
    const char *begin = trimmed.c_str();
    char *end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end != begin + trimmed.size() || errno == ERANGE || !std::isfinite(value))
      return std::nullopt;
    return value;
  }

}
