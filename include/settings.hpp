#pragma once

#include "run_log.hpp"
#include <optional>
#include <string>

namespace cavegeo
{

  struct RunSettings
  {
    std::string target_crs;
    std::string caves_file;
    std::string image_dir;
    std::string output_dir;
    bool apply_grid_convergence = true;
    LogLevel log_level = LogLevel::Info;
  };

  /** true/yes/on/1 or false/no/off/0, any case; anything else is nullopt. */
  std::optional<bool> parse_flag(const std::string &text);

  /** Settings with every field at its compile-time default. */
  RunSettings default_settings();

  /** Reads a YAML/JSON settings file via cv::FileStorage; absent keys and unrecognised flags keep their defaults. */
  std::optional<RunSettings> load_settings(const std::string &path);

}
