#include "config.hpp"
#include "cave_catalog.hpp"
#include "crs_projector.hpp"
#include "georeferencing_orchestrator.hpp"
#include "plan_window.hpp"
#include "raster_export.hpp"
#include "run_log.hpp"
#include "settings.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace
{

  constexpr int EXIT_CANCELLED = 2;

  const char *KEYS =
      "{help h usage ? |       | print this message }"
      "{cave_id        |       | ID of the cave to georeference }"
      "{caves_file     |       | JSONL cave catalog (default caves_transformed.jsonl) }"
      "{image_dir      |       | directory containing cave images (default caves_upscaled) }"
      "{output_dir     |       | directory for output files (default georeferenced_output) }"
      "{crs            |       | target projected CRS (default EPSG:2180) }"
      "{settings       |       | YAML/JSON settings file }"
      "{plan_index     | 0     | which plan image of the cave to use }"
      "{no_convergence | false | do not apply grid convergence }";

  void override_if_set(const cv::CommandLineParser &parser, const char *key, std::string &value)
  {
    std::string arg = parser.get<std::string>(key);
    if (!arg.empty())
      value = arg;
  }

  int export_outputs(const cavegeo::CaveRecord &cave, const cv::Mat &image,
                     const cavegeo::GeoreferenceResult &result, cavegeo::CrsProjector &projector,
                     const std::filesystem::path &output_dir, cavegeo::RunLog &log)
  {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec)
    {
      log.error("Cannot create output directory ", output_dir.string(), ": ", ec.message());
      return 1;
    }

    auto wkt = projector.crs_wkt(result.target_crs);
    if (!wkt.has_value())
    {
      log.error("Cannot build WKT for ", result.target_crs);
      return 1;
    }

    std::string base = cavegeo::output_basename(cave);
    std::filesystem::path geotiff_path = output_dir / (base + ".tif");
    std::filesystem::path world_path = output_dir / (base + ".tfw");
    std::filesystem::path kml_path = output_dir / (base + ".kml");

    if (!cavegeo::write_geotiff(image, result.transform, *wkt, geotiff_path, log))
      return 1;
    if (!cavegeo::write_world_file(result.transform, world_path, log))
      return 1;

    auto box = cavegeo::ground_overlay_bounds(result.transform, image.cols, image.rows, projector,
                                              result.target_crs);
    if (!box.has_value())
    {
      log.error("Cannot reproject the plan bounds to WGS84");
      return 1;
    }
    if (!cavegeo::write_kml(cave.name + " Plan", geotiff_path.filename().string(), *box, kml_path, log))
      return 1;
    return 0;
  }

}

int main(int argc, char **argv)
{
  cv::CommandLineParser parser(argc, argv, KEYS);
  parser.about("Interactive tool to georeference cave plans.");
  if (parser.has("help"))
  {
    parser.printMessage();
    return 0;
  }

  cavegeo::RunSettings settings = cavegeo::default_settings();
  std::string settings_path = parser.get<std::string>("settings");
  if (!settings_path.empty())
  {
    auto loaded = cavegeo::load_settings(settings_path);
    if (!loaded.has_value())
    {
      std::cerr << "Could not read settings file: " << settings_path << "\n";
      return 1;
    }
    settings = *loaded;
  }
  override_if_set(parser, "caves_file", settings.caves_file);
  override_if_set(parser, "image_dir", settings.image_dir);
  override_if_set(parser, "output_dir", settings.output_dir);
  override_if_set(parser, "crs", settings.target_crs);
  if (parser.get<bool>("no_convergence"))
    settings.apply_grid_convergence = false;

  std::string cave_id = parser.get<std::string>("cave_id");
  int plan_index = parser.get<int>("plan_index");
  if (!parser.check() || cave_id.empty() || plan_index < 0)
  {
    parser.printErrors();
    std::cerr << "--cave_id is required and --plan_index must be >= 0.\n";
    parser.printMessage();
    return 1;
  }

  cavegeo::RunLog log(std::cout, settings.log_level);
  try
  {
    auto cave = cavegeo::find_cave(settings.caves_file, cave_id, log);
    if (!cave.has_value())
    {
      log.error("Cave ", cave_id, " not found.");
      return 1;
    }
    log.info("Found cave: ", cave->name, " (Lon: ", cave->entrance.longitude, ", Lat: ", cave->entrance.latitude, ")");

    auto image_path = cavegeo::resolve_plan_image(settings.image_dir, *cave, static_cast<size_t>(plan_index), log);
    if (!image_path.has_value())
      return 1;
    auto image = cavegeo::load_plan_image(*image_path, log);
    if (!image.has_value())
      return 1;

    cavegeo::OgrCrsProjector projector;
    cavegeo::PlanWindow window(*image);
    cavegeo::StreamPrompt prompt(std::cin, std::cout);
    cavegeo::GeoreferencingOrchestrator orchestrator(projector, cavegeo::SessionIo{window, prompt, window}, log,
                                                     settings.apply_grid_convergence);

    log.info("Image loaded. Starting interaction sequence...");
    std::cout << "\n========================================\n"
              << "INTERACTIVE GEOREFERENCING SEQUENCE\n"
              << "Follow instructions in terminal and image window.\n"
              << "Press ESC at any time to cancel.\n"
              << "========================================\n";

    cavegeo::GeoreferenceOutcome outcome = orchestrator.run(cave->entrance, settings.target_crs);
    if (std::holds_alternative<cavegeo::Cancelled>(outcome))
    {
      std::cout << "Operation cancelled by user.\n";
      return EXIT_CANCELLED;
    }
    if (const auto *failure = std::get_if<cavegeo::Failure>(&outcome))
    {
      std::cerr << "Georeferencing failed: " << failure->reason << "\n";
      return 1;
    }

    const auto &result = std::get<cavegeo::GeoreferenceResult>(outcome);
    if (export_outputs(*cave, *image, result, projector, settings.output_dir, log) != 0)
      return 1;

    std::cout << "\n========================================\n"
              << "DONE! Output files generated in:\n"
              << "-> " << settings.output_dir << "\n"
              << "========================================\n";
  }
  catch (const cv::Exception &e)
  {
    std::cerr << "OpenCV error: " << e.what() << "\n";
    return 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
