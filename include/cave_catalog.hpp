#pragma once

#include "run_log.hpp"
#include "types.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cavegeo
{

  struct PlanImage
  {
    std::string image_path;
    std::string graphics_type_name;
  };

  /** One cave from the cleaned JSONL catalog; only plan drawings are kept. */
  struct CaveRecord
  {
    std::string cave_id;
    std::string name;
    std::string inventory_number;
    GeoCoordinate entrance;
    std::vector<PlanImage> plan_images;
  };

  bool is_plan_graphics_type(const std::string &graphics_type_name);

  /** Parses one JSON object line. nullopt if it is not valid JSON or has no cave_id. */
  std::optional<CaveRecord> parse_cave_record(const std::string &json_line);

  std::optional<CaveRecord> find_cave(const std::filesystem::path &catalog_path, const std::string &cave_id,
                                      RunLog &log);

  /** image_dir/cave_id/<file name>, then image_dir/<file name>. */
  std::optional<std::filesystem::path> resolve_plan_image(const std::filesystem::path &image_dir,
                                                          const CaveRecord &record, size_t plan_index,
                                                          RunLog &log);

  std::optional<cv::Mat> load_plan_image(const std::filesystem::path &image_path, RunLog &log);

  /** cave_id + "_" + inventory number with spaces replaced by underscores. */
  std::string output_basename(const CaveRecord &record);

}
