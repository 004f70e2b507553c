#include "settings.hpp"
#include "config.hpp"
#include "parsing.hpp"
#include <algorithm>
#include <cctype>
#include <opencv2/core/persistence.hpp>

namespace cavegeo
{

  namespace
  {
    void read_string(const cv::FileNode &node, std::string &value)
    {
      if (!node.empty() && node.isString())
        value = static_cast<std::string>(node);
    }
  }

  std::optional<bool> parse_flag(const std::string &text)
  {
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1")
      return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0")
      return false;
    return std::nullopt;
  }

  RunSettings default_settings()
  {
    RunSettings s;
    s.target_crs = Config::DEFAULT_TARGET_CRS;
    s.caves_file = Config::CAVES_FILE;
    s.image_dir = Config::IMAGE_DIR;
    s.output_dir = Config::OUTPUT_DIR;
    s.apply_grid_convergence = Config::APPLY_GRID_CONVERGENCE;
    s.log_level = LogLevel::Info;
    return s;
  }

  std::optional<RunSettings> load_settings(const std::string &path)
  {
    cv::FileStorage fs;
    try
    {
      if (!fs.open(path, cv::FileStorage::READ))
        return std::nullopt;
    }
    catch (const cv::Exception &)
    {
      return std::nullopt;
    }
    RunSettings s = default_settings();
    read_string(fs["target_crs"], s.target_crs);
    read_string(fs["caves_file"], s.caves_file);
    read_string(fs["image_dir"], s.image_dir);
    read_string(fs["output_dir"], s.output_dir);
    cv::FileNode convergence = fs["apply_grid_convergence"];
    if (convergence.isInt())
      s.apply_grid_convergence = static_cast<int>(convergence) != 0;
    else if (convergence.isString())
    {
      auto flag = parse_flag(static_cast<std::string>(convergence));
      if (flag.has_value())
        s.apply_grid_convergence = *flag;
    }
    std::string level;
    read_string(fs["log_level"], level);
    if (!level.empty())
      s.log_level = parse_log_level(level);
    fs.release();
    return s;
  }

}
