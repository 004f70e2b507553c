#include <gtest/gtest.h>
#include "raster_export.hpp"
#include "test_support.hpp"
#include <gdal_priv.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace cavegeo;
using namespace cavegeo::testing;
namespace fs = std::filesystem;

namespace
{

  fs::path scratch_dir()
  {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() / (std::string("cavegeo_raster_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
  }

  AffineTransform north_up(double x, double y, double mpp)
  {
    return AffineTransform::translation(x, y) * AffineTransform::scale(mpp, -mpp);
  }

}

TEST(RasterExportTest, ProjectedBoundsCoverAllCorners)
{
  ProjectedBounds b = projected_bounds(north_up(100.0, 200.0, 0.5), 10, 20);
  EXPECT_DOUBLE_EQ(b.min_x, 100.0);
  EXPECT_DOUBLE_EQ(b.max_x, 105.0);
  EXPECT_DOUBLE_EQ(b.min_y, 190.0);
  EXPECT_DOUBLE_EQ(b.max_y, 200.0);

  ProjectedBounds r = projected_bounds(AffineTransform::rotation(90.0), 10, 20);
  EXPECT_DOUBLE_EQ(r.min_x, -20.0);
  EXPECT_DOUBLE_EQ(r.max_x, 0.0);
  EXPECT_DOUBLE_EQ(r.min_y, 0.0);
  EXPECT_DOUBLE_EQ(r.max_y, 10.0);
}

TEST(RasterExportTest, GroundOverlayBoundsAreReprojected)
{
  FakeProjector projector;
  auto box = ground_overlay_bounds(north_up(500000.0, 5000000.0, 10.0), 1000, 500, projector, "EPSG:2180");
  ASSERT_TRUE(box.has_value());
  EXPECT_NEAR(box->north, 50.0, 1e-12);
  EXPECT_NEAR(box->south, 49.95, 1e-12);
  EXPECT_NEAR(box->east, 0.1, 1e-12);
  EXPECT_NEAR(box->west, 0.0, 1e-12);

  projector.fail = true;
  EXPECT_FALSE(ground_overlay_bounds(north_up(0.0, 0.0, 1.0), 10, 10, projector, "EPSG:2180").has_value());
}

TEST(RasterExportTest, KmlGroundOverlayEscapesNames)
{
  LatLonBox box{50.25, 50.0, 19.5, 19.25};
  std::string kml = kml_ground_overlay("Jaskinia <Mała> & Co", "cave.tif", box);
  EXPECT_NE(kml.find("<kml xmlns=\"http://www.opengis.net/kml/2.2\">"), std::string::npos);
  EXPECT_NE(kml.find("<name>Jaskinia &lt;Mała&gt; &amp; Co</name>"), std::string::npos);
  EXPECT_NE(kml.find("<href>cave.tif</href>"), std::string::npos);
  EXPECT_NE(kml.find("<north>50.25</north>"), std::string::npos);
  EXPECT_NE(kml.find("<south>50</south>"), std::string::npos);
  EXPECT_NE(kml.find("<east>19.5</east>"), std::string::npos);
  EXPECT_NE(kml.find("<west>19.25</west>"), std::string::npos);
}

TEST(RasterExportTest, KmlEscapingKeepsUtf8AndQuotes)
{
  LatLonBox box{1.0, 0.0, 1.0, 0.0};
  std::string kml = kml_ground_overlay("Szczelina \"Zimna\"", "a&b.tif", box);
  EXPECT_NE(kml.find("<name>Szczelina &quot;Zimna&quot;</name>"), std::string::npos);
  EXPECT_NE(kml.find("<href>a&amp;b.tif</href>"), std::string::npos);
}

TEST(RasterExportTest, WorldFileUsesPixelCentre)
{
  fs::path dir = scratch_dir();
  std::ostringstream out;
  RunLog log(out);
  ASSERT_TRUE(write_world_file(north_up(1000.0, 2000.0, 0.5), dir / "plan.tfw", log));

  std::ifstream in(dir / "plan.tfw");
  std::ostringstream text;
  text << in.rdbuf();
  EXPECT_EQ(text.str(), "0.5000000000\n"
                        "0.0000000000\n"
                        "0.0000000000\n"
                        "-0.5000000000\n"
                        "1000.2500000000\n"
                        "1999.7500000000\n");
  EXPECT_FALSE(write_world_file(AffineTransform::identity(), dir / "plan", log));
  fs::remove_all(dir);
}

TEST(RasterExportTest, ReadWorldFileShiftsToPixelCorner)
{
  fs::path dir = scratch_dir();
  std::ofstream(dir / "rotated.wld") << "2.0\r\n0.5\r\n0.25\r\n-2.0\r\n100.0\r\n300.0\r\n";

  auto t = read_world_file(dir / "rotated.wld");
  ASSERT_TRUE(t.has_value());
  EXPECT_DOUBLE_EQ(t->a, 2.0);
  EXPECT_DOUBLE_EQ(t->d, 0.5);
  EXPECT_DOUBLE_EQ(t->b, 0.25);
  EXPECT_DOUBLE_EQ(t->e, -2.0);
  EXPECT_DOUBLE_EQ(t->c, 100.0 - 1.0 - 0.125);
  EXPECT_DOUBLE_EQ(t->f, 300.0 - 0.25 + 1.0);

  cv::Point2d centre = t->apply({0.5, 0.5});
  EXPECT_DOUBLE_EQ(centre.x, 100.0);
  EXPECT_DOUBLE_EQ(centre.y, 300.0);
  fs::remove_all(dir);
}

TEST(RasterExportTest, ReadWorldFileRejectsIncompleteOrDegenerate)
{
  fs::path dir = scratch_dir();
  std::ofstream(dir / "short.tfw") << "1\n0\n0\n-1\n5\n";
  std::ofstream(dir / "flat.tfw") << "0\n0\n0\n-1\n5\n6\n";
  std::ofstream(dir / "empty.tfw") << "";

  EXPECT_FALSE(read_world_file(dir / "short.tfw").has_value());
  EXPECT_FALSE(read_world_file(dir / "flat.tfw").has_value());
  EXPECT_FALSE(read_world_file(dir / "empty.tfw").has_value());
  EXPECT_FALSE(read_world_file(dir / "missing.tfw").has_value());
  fs::remove_all(dir);
}

TEST(RasterExportTest, WorldFileOnDiskAndDiscovery)
{
  fs::path dir = scratch_dir();
  fs::path image = dir / "plan.jpg";
  std::ofstream(image) << "x";
  EXPECT_FALSE(find_world_file(image).has_value());

  std::ostringstream out;
  RunLog log(out);
  AffineTransform t = north_up(5000.0, 7000.0, 0.25);
  ASSERT_TRUE(write_world_file(t, dir / "plan.jgw", log));

  auto found = find_world_file(image);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, dir / "plan.jgw");

  // An unreadable .tfw is passed over; a valid one takes precedence.
  std::ofstream(dir / "plan.tfw") << "junk\n";
  EXPECT_EQ(*find_world_file(image), dir / "plan.jgw");
  ASSERT_TRUE(write_world_file(t, dir / "plan.tfw", log));
  EXPECT_EQ(*find_world_file(image), dir / "plan.tfw");

  auto back = read_world_file(*found);
  ASSERT_TRUE(back.has_value());
  EXPECT_NEAR(back->c, 5000.0, 1e-9);
  EXPECT_NEAR(back->f, 7000.0, 1e-9);
  fs::remove_all(dir);
}

TEST(RasterExportTest, GeoTiffCarriesTransformAndRgbBands)
{
  fs::path dir = scratch_dir();
  fs::path tif = dir / "plan.tif";
  cv::Mat image(8, 12, CV_8UC3, cv::Scalar(255, 0, 0));
  AffineTransform t = north_up(500000.0, 250000.0, 0.5);

  std::ostringstream out;
  RunLog log(out);
  ASSERT_TRUE(write_geotiff(image, t, "", tif, log));

  GDALAllRegister();
  GDALDataset *ds = static_cast<GDALDataset *>(GDALOpen(tif.string().c_str(), GA_ReadOnly));
  ASSERT_NE(ds, nullptr);
  EXPECT_EQ(ds->GetRasterXSize(), 12);
  EXPECT_EQ(ds->GetRasterYSize(), 8);
  EXPECT_EQ(ds->GetRasterCount(), 3);
  double gt[6];
  ASSERT_EQ(ds->GetGeoTransform(gt), CE_None);
  EXPECT_DOUBLE_EQ(gt[0], 500000.0);
  EXPECT_DOUBLE_EQ(gt[1], 0.5);
  EXPECT_DOUBLE_EQ(gt[3], 250000.0);
  EXPECT_DOUBLE_EQ(gt[5], -0.5);

  // Blue in BGR must land in the third (blue) band.
  GByte red = 1;
  GByte blue = 0;
  ASSERT_EQ(ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, 1, 1, &red, 1, 1, GDT_Byte, 0, 0, nullptr), CE_None);
  ASSERT_EQ(ds->GetRasterBand(3)->RasterIO(GF_Read, 0, 0, 1, 1, &blue, 1, 1, GDT_Byte, 0, 0, nullptr), CE_None);
  EXPECT_EQ(red, 0);
  EXPECT_EQ(blue, 255);
  GDALClose(ds);
  fs::remove_all(dir);
}

TEST(RasterExportTest, GeoTiffRejectsNonByteImages)
{
  std::ostringstream out;
  RunLog log(out);
  cv::Mat deep(4, 4, CV_16UC1, cv::Scalar(1000));
  EXPECT_FALSE(write_geotiff(deep, AffineTransform::identity(), "", fs::temp_directory_path() / "deep.tif", log));
  EXPECT_FALSE(write_geotiff(cv::Mat(), AffineTransform::identity(), "", fs::temp_directory_path() / "empty.tif", log));
  EXPECT_EQ(log.error_count(), 2);
}
