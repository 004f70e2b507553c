#pragma once

#include "affine_transform.hpp"
#include "crs_projector.hpp"
#include "run_log.hpp"
#include "types.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace cavegeo
{

  /** Projected extent of a georeferenced image. */
  struct ProjectedBounds
  {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
  };

  /** WGS84 box of a KML GroundOverlay. */
  struct LatLonBox
  {
    double north = 0.0;
    double south = 0.0;
    double east = 0.0;
    double west = 0.0;
  };

  /** Min/max of the four image corners under the transform. */
  ProjectedBounds projected_bounds(const AffineTransform &transform, int width, int height);

  std::optional<LatLonBox> ground_overlay_bounds(const AffineTransform &transform, int width, int height,
                                                 CrsProjector &projector, const std::string &crs);

  /** 8-bit BGR, BGRA or grayscale image to an LZW GeoTIFF in RGB(A) band order. */
  bool write_geotiff(const cv::Mat &image, const AffineTransform &transform, const std::string &crs_wkt,
                     const std::filesystem::path &path, RunLog &log);

  std::string kml_ground_overlay(const std::string &name, const std::string &image_href, const LatLonBox &box);

  bool write_kml(const std::string &name, const std::string &image_href, const LatLonBox &box,
                 const std::filesystem::path &path, RunLog &log);

  /**
   * World files give the centre of the upper-left pixel; AffineTransform maps pixel
   * corners (GDAL convention). GDAL's world file routines convert between the two.
   */
  std::optional<AffineTransform> read_world_file(const std::filesystem::path &path);
  bool write_world_file(const AffineTransform &transform, const std::filesystem::path &path, RunLog &log);

  /** First readable <stem>.tfw, .jgw, .pgw or .wld next to the image. */
  std::optional<std::filesystem::path> find_world_file(const std::filesystem::path &image_path);

}
