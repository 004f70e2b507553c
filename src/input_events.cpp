#include "input_events.hpp"

namespace cavegeo
{

  StreamPrompt::StreamPrompt(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  std::optional<std::string> StreamPrompt::ask(const std::string &question)
  {
    out_ << question << std::flush;
    std::string line;
    if (!std::getline(in_, line))
      return std::nullopt;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  }

}
