#include "raster_export.hpp"
#include "config.hpp"
#include <opencv2/imgproc.hpp>
#include <gdal_priv.h>
#include <cpl_string.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace cavegeo
{

  namespace
  {
    struct DatasetCloser
    {
      void operator()(GDALDataset *ds) const { GDALClose(ds); }
    };

    std::string xml_escape(const std::string &text)
    {
      char *escaped = CPLEscapeString(text.c_str(), -1, CPLES_XML);
      std::string out(escaped);
      CPLFree(escaped);
      return out;
    }
  }

  ProjectedBounds projected_bounds(const AffineTransform &transform, int width, int height)
  {
    const cv::Point2d corners[] = {
        transform.apply({0.0, 0.0}),
        transform.apply({static_cast<double>(width), 0.0}),
        transform.apply({0.0, static_cast<double>(height)}),
        transform.apply({static_cast<double>(width), static_cast<double>(height)})};
    ProjectedBounds b{corners[0].x, corners[0].y, corners[0].x, corners[0].y};
    for (const auto &c : corners)
    {
      b.min_x = std::min(b.min_x, c.x);
      b.min_y = std::min(b.min_y, c.y);
      b.max_x = std::max(b.max_x, c.x);
      b.max_y = std::max(b.max_y, c.y);
    }
    return b;
  }

  std::optional<LatLonBox> ground_overlay_bounds(const AffineTransform &transform, int width, int height,
                                                 CrsProjector &projector, const std::string &crs)
  {
    ProjectedBounds b = projected_bounds(transform, width, height);
    auto lower_left = projector.to_geographic(WorldPoint(b.min_x, b.min_y), crs);
    auto upper_right = projector.to_geographic(WorldPoint(b.max_x, b.max_y), crs);
    if (!lower_left.has_value() || !upper_right.has_value())
      return std::nullopt;
    LatLonBox box;
    box.north = std::max(lower_left->latitude, upper_right->latitude);
    box.south = std::min(lower_left->latitude, upper_right->latitude);
    box.east = std::max(lower_left->longitude, upper_right->longitude);
    box.west = std::min(lower_left->longitude, upper_right->longitude);
    return box;
  }

  bool write_geotiff(const cv::Mat &image, const AffineTransform &transform, const std::string &crs_wkt,
                     const std::filesystem::path &path, RunLog &log)
  {
    if (image.empty() || image.depth() != CV_8U)
    {
      log.error("GeoTIFF export needs a non-empty 8-bit image");
      return false;
    }
    cv::Mat bands_img;
    switch (image.channels())
    {
    case 1:
      bands_img = image;
      break;
    case 3:
      cv::cvtColor(image, bands_img, cv::COLOR_BGR2RGB);
      break;
    case 4:
      cv::cvtColor(image, bands_img, cv::COLOR_BGRA2RGBA);
      break;
    default:
      log.error("Unsupported channel count for GeoTIFF: ", image.channels());
      return false;
    }
    if (!bands_img.isContinuous())
      bands_img = bands_img.clone();

    GDALAllRegister();
    GDALDriver *driver = GetGDALDriverManager()->GetDriverByName(Config::GEOTIFF_DRIVER);
    if (!driver)
    {
      log.error("GDAL driver not available: ", Config::GEOTIFF_DRIVER);
      return false;
    }

    const int width = bands_img.cols;
    const int height = bands_img.rows;
    const int bands = bands_img.channels();
    char **options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", Config::GEOTIFF_COMPRESS);
    if (bands >= 3)
      options = CSLSetNameValue(options, "PHOTOMETRIC", "RGB");
    if (bands == 4)
      options = CSLSetNameValue(options, "ALPHA", "YES");
    std::unique_ptr<GDALDataset, DatasetCloser> ds(
        driver->Create(path.string().c_str(), width, height, bands, GDT_Byte, options));
    CSLDestroy(options);
    if (!ds)
    {
      log.error("Failed to create GeoTIFF ", path.string(), ": ", CPLGetLastErrorMsg());
      return false;
    }

    std::array<double, 6> geo_transform = transform.to_gdal();
    if (ds->SetGeoTransform(geo_transform.data()) != CE_None)
    {
      log.error("Failed to set geotransform: ", CPLGetLastErrorMsg());
      return false;
    }
    if (!crs_wkt.empty() && ds->SetProjection(crs_wkt.c_str()) != CE_None)
    {
      log.error("Failed to set projection: ", CPLGetLastErrorMsg());
      return false;
    }

    for (int band = 1; band <= bands; ++band)
    {
      GDALRasterBand *out_band = ds->GetRasterBand(band);
      CPLErr err = out_band->RasterIO(GF_Write, 0, 0, width, height,
                                      bands_img.data + (band - 1), width, height, GDT_Byte,
                                      bands, static_cast<GSpacing>(bands_img.step[0]), nullptr);
      if (err != CE_None)
      {
        log.error("RasterIO failed on band ", band, ": ", CPLGetLastErrorMsg());
        return false;
      }
    }
    log.info("Successfully saved GeoTIFF: ", path.string());
    return true;
  }

  std::string kml_ground_overlay(const std::string &name, const std::string &image_href, const LatLonBox &box)
  {
    std::ostringstream kml;
    kml << std::setprecision(10)
        << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<kml xmlns=\"http://www.opengis.net/kml/2.2\">\n"
        << "  <Document>\n"
        << "    <GroundOverlay>\n"
        << "      <name>" << xml_escape(name) << "</name>\n"
        << "      <Icon>\n"
        << "        <href>" << xml_escape(image_href) << "</href>\n"
        << "      </Icon>\n"
        << "      <LatLonBox>\n"
        << "        <north>" << box.north << "</north>\n"
        << "        <south>" << box.south << "</south>\n"
        << "        <east>" << box.east << "</east>\n"
        << "        <west>" << box.west << "</west>\n"
        << "      </LatLonBox>\n"
        << "    </GroundOverlay>\n"
        << "  </Document>\n"
        << "</kml>\n";
    return kml.str();
  }

  bool write_kml(const std::string &name, const std::string &image_href, const LatLonBox &box,
                 const std::filesystem::path &path, RunLog &log)
  {
    std::ofstream out(path);
    if (!out)
    {
      log.error("Cannot open KML for writing: ", path.string());
      return false;
    }
    out << kml_ground_overlay(name, image_href, box);
    if (!out)
    {
      log.error("Failed to write KML: ", path.string());
      return false;
    }
    log.info("Successfully saved KML: ", path.string());
    return true;
  }

  std::optional<AffineTransform> read_world_file(const std::filesystem::path &path)
  {
    double geo_transform[6];
    if (!GDALLoadWorldFile(path.string().c_str(), geo_transform))
      return std::nullopt;
    return AffineTransform::from_gdal(geo_transform);
  }

  bool write_world_file(const AffineTransform &transform, const std::filesystem::path &path, RunLog &log)
  {
    std::string extension = path.extension().string();
    if (extension.size() < 2)
    {
      log.error("World file path needs an extension: ", path.string());
      return false;
    }
    std::array<double, 6> geo_transform = transform.to_gdal();
    if (!GDALWriteWorldFile(path.string().c_str(), extension.c_str() + 1, geo_transform.data()))
    {
      log.error("Failed to write world file ", path.string(), ": ", CPLGetLastErrorMsg());
      return false;
    }
    log.info("Successfully saved world file: ", path.string());
    return true;
  }

  std::optional<std::filesystem::path> find_world_file(const std::filesystem::path &image_path)
  {
    double geo_transform[6];
    for (const char *ext : Config::WORLD_FILE_EXTENSIONS)
    {
      if (!GDALReadWorldFile(image_path.string().c_str(), ext, geo_transform))
        continue;
      // GDAL also accepts the upper-case spelling of the extension.
      std::filesystem::path candidate = image_path;
      candidate.replace_extension(ext);
      if (!std::filesystem::exists(candidate))
        candidate.replace_extension(std::string(CPLString(ext).toupper()));
      return candidate;
    }
    return std::nullopt;
  }

}
