#include "crs_projector.hpp"
#include "config.hpp"
#include <cpl_conv.h>
#include <ogr_spatialref.h>

namespace cavegeo
{

  namespace
  {
    std::unique_ptr<OGRSpatialReference> make_srs(const std::string &definition)
    {
      auto srs = std::make_unique<OGRSpatialReference>();
      if (srs->SetFromUserInput(definition.c_str()) != OGRERR_NONE)
        return nullptr;
      srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
      return srs;
    }
  }

  OgrCrsProjector::OgrCrsProjector() : wgs84_(make_srs(Config::WGS84_CRS)) {}

  OgrCrsProjector::~OgrCrsProjector() = default;

  OgrCrsProjector::Transforms *OgrCrsProjector::transforms_for(const std::string &crs)
  {
    auto it = cache_.find(crs);
    if (it != cache_.end())
      return &it->second;
    if (!wgs84_)
      return nullptr;

    Transforms t;
    t.srs = make_srs(crs);
    if (!t.srs)
      return nullptr;
    t.forward.reset(OGRCreateCoordinateTransformation(wgs84_.get(), t.srs.get()));
    t.backward.reset(OGRCreateCoordinateTransformation(t.srs.get(), wgs84_.get()));
    if (!t.forward || !t.backward)
      return nullptr;
    return &cache_.emplace(crs, std::move(t)).first->second;
  }

  std::optional<WorldPoint> OgrCrsProjector::to_projected(const GeoCoordinate &geo, const std::string &target_crs)
  {
    Transforms *t = transforms_for(target_crs);
    if (!t)
      return std::nullopt;
    double x = geo.longitude;
    double y = geo.latitude;
    if (!t->forward->Transform(1, &x, &y))
      return std::nullopt;
    return WorldPoint(x, y);
  }

  std::optional<GeoCoordinate> OgrCrsProjector::to_geographic(const WorldPoint &world, const std::string &source_crs)
  {
    Transforms *t = transforms_for(source_crs);
    if (!t)
      return std::nullopt;
    double x = world.x;
    double y = world.y;
    if (!t->backward->Transform(1, &x, &y))
      return std::nullopt;
    GeoCoordinate geo;
    geo.longitude = x;
    geo.latitude = y;
    return geo;
  }

  std::optional<std::string> OgrCrsProjector::crs_wkt(const std::string &crs)
  {
    Transforms *t = transforms_for(crs);
    if (!t)
      return std::nullopt;
    char *wkt = nullptr;
    if (t->srs->exportToWkt(&wkt) != OGRERR_NONE || !wkt)
    {
      CPLFree(wkt);
      return std::nullopt;
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
  }

}
