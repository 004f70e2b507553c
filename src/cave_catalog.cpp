#include "cave_catalog.hpp"
#include "config.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cpl_error.h>
#include <cpl_json.h>
#include <algorithm>
#include <fstream>

namespace cavegeo
{

  namespace
  {
    /** Silences CPLError output for the lifetime of the guard. */
    struct QuietGdalErrors
    {
      QuietGdalErrors() { CPLPushErrorHandler(CPLQuietErrorHandler); }
      ~QuietGdalErrors() { CPLPopErrorHandler(); }
      QuietGdalErrors(const QuietGdalErrors &) = delete;
      QuietGdalErrors &operator=(const QuietGdalErrors &) = delete;
    };

    // null and missing keys both read as absent.
    std::string read_string(const CPLJSONObject &parent, const char *key)
    {
      CPLJSONObject node = parent.GetObj(key);
      if (node.GetType() != CPLJSONObject::Type::String)
        return {};
      return node.ToString();
    }

    double read_number(const CPLJSONObject &parent, const char *key)
    {
      CPLJSONObject node = parent.GetObj(key);
      switch (node.GetType())
      {
      case CPLJSONObject::Type::Integer:
      case CPLJSONObject::Type::Long:
      case CPLJSONObject::Type::Double:
        return node.ToDouble(0.0);
      default:
        return 0.0;
      }
    }
  }

  bool is_plan_graphics_type(const std::string &graphics_type_name)
  {
    for (const char *type : Config::PLAN_GRAPHICS_TYPES)
    {
      if (graphics_type_name == type)
        return true;
    }
    return false;
  }

  std::optional<CaveRecord> parse_cave_record(const std::string &json_line)
  {
    CPLJSONDocument document;
    {
      QuietGdalErrors quiet;
      if (!document.LoadMemory(json_line))
        return std::nullopt;
    }
    const CPLJSONObject root = document.GetRoot();
    if (root.GetType() != CPLJSONObject::Type::Object)
      return std::nullopt;

    CaveRecord record;
    record.cave_id = read_string(root, "cave_id");
    if (record.cave_id.empty())
      return std::nullopt;
    record.name = read_string(root, "name");
    record.inventory_number = read_string(root, "inventory_number");
    record.entrance.latitude = read_number(root, "latitude");
    record.entrance.longitude = read_number(root, "longitude");

    CPLJSONObject images = root.GetObj("images");
    if (images.GetType() == CPLJSONObject::Type::Array)
    {
      for (const CPLJSONObject &image : images.ToArray())
      {
        if (image.GetType() != CPLJSONObject::Type::Object)
          continue;
        PlanImage plan;
        plan.image_path = read_string(image, "image_path");
        CPLJSONObject metadata = image.GetObj("metadata");
        if (metadata.GetType() == CPLJSONObject::Type::Object)
          plan.graphics_type_name = read_string(metadata, "graphics_type_name");
        if (!plan.image_path.empty() && is_plan_graphics_type(plan.graphics_type_name))
          record.plan_images.push_back(plan);
      }
    }
    return record;
  }

  std::optional<CaveRecord> find_cave(const std::filesystem::path &catalog_path, const std::string &cave_id,
                                      RunLog &log)
  {
    log.info("Searching for cave ID: ", cave_id, "...");
    std::ifstream in(catalog_path);
    if (!in)
    {
      log.error("Caves file not found: ", catalog_path.string());
      return std::nullopt;
    }
    std::string line;
    int skipped = 0;
    while (std::getline(in, line))
    {
      if (line.find(cave_id) == std::string::npos)
        continue;
      auto record = parse_cave_record(line);
      if (!record.has_value())
      {
        ++skipped;
        continue;
      }
      if (record->cave_id == cave_id)
        return record;
    }
    if (skipped > 0)
      log.debug("Skipped ", skipped, " unparsable catalog lines");
    return std::nullopt;
  }

  std::optional<std::filesystem::path> resolve_plan_image(const std::filesystem::path &image_dir,
                                                          const CaveRecord &record, size_t plan_index,
                                                          RunLog &log)
  {
    namespace fs = std::filesystem;
    if (record.plan_images.empty())
    {
      log.error("No plan images found for this cave.");
      return std::nullopt;
    }
    if (plan_index >= record.plan_images.size())
    {
      log.error("Plan index ", plan_index, " out of range (", record.plan_images.size(), " plans).");
      return std::nullopt;
    }
    fs::path file_name = fs::path(record.plan_images[plan_index].image_path).filename();
    fs::path candidate = image_dir / record.cave_id / file_name;
    if (fs::exists(candidate))
      return candidate;
    candidate = image_dir / file_name;
    if (fs::exists(candidate))
      return candidate;
    log.error("Image file not found at ", candidate.string());
    return std::nullopt;
  }

  std::optional<cv::Mat> load_plan_image(const std::filesystem::path &image_path, RunLog &log)
  {
    log.info("Loading image: ", image_path.string());
    cv::Mat image = cv::imread(image_path.string(), cv::IMREAD_COLOR);
    if (image.empty())
    {
      log.error("Failed to decode image: ", image_path.string());
      return std::nullopt;
    }
    return image;
  }

  std::string output_basename(const CaveRecord &record)
  {
    std::string inventory = record.inventory_number;
    std::replace(inventory.begin(), inventory.end(), ' ', '_');
    return record.cave_id + "_" + inventory;
  }

}
