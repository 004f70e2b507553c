#pragma once

#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

class OGRCoordinateTransformation;
class OGRSpatialReference;

namespace cavegeo
{

  /** WGS84 <-> projected CRS conversion, x = easting/longitude. */
  class CrsProjector
  {
  public:
    virtual ~CrsProjector() = default;
    virtual std::optional<WorldPoint> to_projected(const GeoCoordinate &geo, const std::string &target_crs) = 0;
    virtual std::optional<GeoCoordinate> to_geographic(const WorldPoint &world, const std::string &source_crs) = 0;
    virtual std::optional<std::string> crs_wkt(const std::string &crs) = 0;
  };

  /** GDAL/OGR backed projector. Accepts anything OGRSpatialReference::SetFromUserInput does. */
  class OgrCrsProjector : public CrsProjector
  {
  public:
    OgrCrsProjector();
    ~OgrCrsProjector() override;

    std::optional<WorldPoint> to_projected(const GeoCoordinate &geo, const std::string &target_crs) override;
    std::optional<GeoCoordinate> to_geographic(const WorldPoint &world, const std::string &source_crs) override;
    std::optional<std::string> crs_wkt(const std::string &crs) override;

  private:
    struct Transforms
    {
      std::unique_ptr<OGRSpatialReference> srs;
      std::unique_ptr<OGRCoordinateTransformation> forward;
      std::unique_ptr<OGRCoordinateTransformation> backward;
    };

    Transforms *transforms_for(const std::string &crs);

    std::unique_ptr<OGRSpatialReference> wgs84_;
    std::map<std::string, Transforms> cache_;
  };

}
