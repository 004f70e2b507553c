#include "cave_catalog.hpp"
#include "crs_projector.hpp"
#include "raster_export.hpp"
#include "run_log.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace
{

  const char *KEYS =
      "{help h usage ? |           | print this message }"
      "{@image         |           | input image (jpg, png) }"
      "{@worldfile     |           | world file (.tfw, .jgw); auto-detected if omitted }"
      "{crs            | EPSG:2180 | coordinate reference system of the world file }"
      "{output o       |           | output GeoTIFF path (default <image>_georef.tif) }";

}

int main(int argc, char **argv)
{
  namespace fs = std::filesystem;

  cv::CommandLineParser parser(argc, argv, KEYS);
  parser.about("Apply a world file to an image and write a GeoTIFF.");
  if (parser.has("help"))
  {
    parser.printMessage();
    return 0;
  }
  fs::path image_path = parser.get<std::string>("@image");
  std::string world_arg = parser.get<std::string>("@worldfile");
  std::string crs = parser.get<std::string>("crs");
  std::string output_arg = parser.get<std::string>("output");
  if (!parser.check() || image_path.empty())
  {
    parser.printErrors();
    parser.printMessage();
    return 1;
  }

  if (!fs::exists(image_path))
  {
    std::cerr << "Error: Image file not found: " << image_path.string() << "\n";
    return 1;
  }

  fs::path world_path;
  if (!world_arg.empty())
  {
    world_path = world_arg;
    if (!fs::exists(world_path))
    {
      std::cerr << "Error: World file not found: " << world_path.string() << "\n";
      return 1;
    }
  }
  else
  {
    auto found = cavegeo::find_world_file(image_path);
    if (!found.has_value())
    {
      std::cerr << "Error: No world file found for " << image_path.string()
                << ". Create a .tfw file or specify it explicitly.\n";
      return 1;
    }
    world_path = *found;
  }

  fs::path output_path = output_arg.empty()
                             ? image_path.parent_path() / (image_path.stem().string() + "_georef.tif")
                             : fs::path(output_arg);

  std::cout << "Image:      " << image_path.string() << "\n"
            << "World file: " << world_path.string() << "\n"
            << "CRS:        " << crs << "\n";

  auto transform = cavegeo::read_world_file(world_path);
  if (!transform.has_value())
  {
    std::cerr << "Error parsing world file: expected six numeric lines\n";
    return 1;
  }
  std::cout << "Transform:\n" << *transform << "\n";

  cavegeo::RunLog log(std::cout);
  try
  {
    auto image = cavegeo::load_plan_image(image_path, log);
    if (!image.has_value())
      return 1;
    cavegeo::OgrCrsProjector projector;
    auto wkt = projector.crs_wkt(crs);
    if (!wkt.has_value())
    {
      std::cerr << "Error: unknown CRS " << crs << "\n";
      return 1;
    }
    if (!cavegeo::write_geotiff(*image, *transform, *wkt, output_path, log))
      return 1;
  }
  catch (const cv::Exception &e)
  {
    std::cerr << "OpenCV error: " << e.what() << "\n";
    return 1;
  }
  std::cout << "Output:     " << output_path.string() << "\n"
            << "Done!\n";
  return 0;
}
