#include "gtest/gtest.h"

#include <demtile/types/raster-format.hpp>
#include <demtile/util/json.hpp>

using namespace demtile;

TEST(RasterFormat, Known)
{
    const auto& known(RasterFormat::known());
    ASSERT_EQ(known.size(), 4u);

    const RasterFormat hgt(RasterFormat::srtmHgt());
    EXPECT_EQ(hgt.type(), RasterType::SrtmHgt);
    EXPECT_EQ(hgt.extension(), ".hgt");
    EXPECT_TRUE(hgt.isGridRegistered());

    const RasterFormat tif(RasterFormat::geoTiff());
    EXPECT_EQ(tif.type(), RasterType::GeoTiff);
    EXPECT_EQ(tif.extension(), ".tif");
    EXPECT_FALSE(tif.isGridRegistered());

    EXPECT_NE(hgt, tif);
}

TEST(RasterFormat, Matches)
{
    const RasterFormat hgt(RasterFormat::srtmHgt());
    EXPECT_TRUE(hgt.matches("N45E005.hgt"));
    EXPECT_TRUE(hgt.matches("dir/N45E005.HGT"));
    EXPECT_FALSE(hgt.matches("N45E005.tif"));
    EXPECT_FALSE(hgt.matches("gt"));
}

TEST(RasterFormat, Json)
{
    for (const auto& format : RasterFormat::known())
    {
        EXPECT_EQ(RasterFormat(format.toJson()), format);
    }

    const Json::Value json(RasterFormat::netCdf().toJson());
    EXPECT_EQ(json["type"].asString(), "cf-netcdf");
    EXPECT_EQ(json["registration"].asString(), "cell");

    Json::Value bad(json);
    bad["type"] = "jpeg2000";
    EXPECT_ANY_THROW(RasterFormat{bad});

    EXPECT_ANY_THROW(RasterFormat(parse("\"geotiff\"")));
}

TEST(RasterFormat, Strings)
{
    EXPECT_EQ(
            toRasterType(toString(RasterType::AsciiGrid)),
            RasterType::AsciiGrid);
    EXPECT_EQ(toRegistration("grid"), Registration::Grid);
    EXPECT_ANY_THROW(toRegistration("area"));
}
