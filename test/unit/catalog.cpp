#include "gtest/gtest.h"
#include "verify.hpp"

#include <demtile/types/catalog.hpp>
#include <demtile/types/exceptions.hpp>
#include <demtile/util/json.hpp>

using namespace demtile;

namespace
{
    const Verify v;

    // A one-degree SRTM tile with its south-west corner at (lon, lat).
    FileMetadata tileAt(int lon, int lat)
    {
        const std::string name(
                "N" + std::to_string(lat) + "E00" + std::to_string(lon) +
                ".hgt");

        FileMetadata m(name, RasterFormat::srtmHgt());
        m.setDataStartLat(lat + 1);
        m.setDataEndLat(lat);
        m.setDataStartLon(lon);
        m.setDataEndLon(lon + 1);
        return m;
    }

    // A record as written at version 2.1: bare format name and extension,
    // and the bound fields under their older names.
    const std::string recordAt21(R"({
        "version": "2.1",
        "filename": "srtm/N45E006.hgt",
        "fileFormat": { "name": "SRTM HGT", "fileExtension": ".hgt" },
        "height": 3601,
        "width": 3601,
        "dataStartLatitude": 46,
        "dataStartLongitude": 6,
        "dataEndLatitude": 45,
        "dataEndLongitude": 7,
        "noDataValue": "-32768"
    })");

    Config quiet(bool strict = true)
    {
        Json::Value json;
        json["verbose"] = false;
        json["strictVersion"] = strict;
        return Config(json);
    }
}

TEST(Catalog, AddAndFind)
{
    Catalog catalog(quiet());
    EXPECT_TRUE(catalog.empty());

    EXPECT_TRUE(catalog.add(tileAt(5, 45)));
    EXPECT_TRUE(catalog.add(tileAt(6, 45)));
    EXPECT_EQ(catalog.size(), 2u);

    const FileMetadata* found(catalog.find("anywhere/N45E005.hgt"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->boundingBox(), BoundingBox(5, 6, 45, 46));

    EXPECT_EQ(catalog.find("N45E007.hgt"), nullptr);
}

TEST(Catalog, Deduplicates)
{
    Catalog catalog(quiet());

    FileMetadata first(tileAt(5, 45));
    first.setHeight(1);
    FileMetadata second("mirror/N45E005.hgt", RasterFormat::srtmHgt());
    second.setHeight(2);

    EXPECT_TRUE(catalog.add(first));
    EXPECT_FALSE(catalog.add(second));
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.find("N45E005.hgt")->height(), 1);
}

TEST(Catalog, RejectsVirtual)
{
    Catalog catalog(quiet());
    EXPECT_FALSE(catalog.add(tileAt(5, 45).cloneAsVirtual()));
    EXPECT_TRUE(catalog.empty());
}

TEST(Catalog, Intersecting)
{
    Catalog catalog(quiet());
    for (int lon(5); lon < 9; ++lon) catalog.add(tileAt(lon, 45));

    const auto hits(catalog.intersecting(BoundingBox(6.5, 7.5, 45.2, 45.8)));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].filename(), "N45E006.hgt");
    EXPECT_EQ(hits[1].filename(), "N45E007.hgt");

    EXPECT_TRUE(catalog.intersecting(BoundingBox(20, 21, 0, 1)).empty());

    EXPECT_EQ(catalog.bounds(), BoundingBox(5, 9, 45, 46));
    EXPECT_EQ(Catalog(quiet()).bounds(), BoundingBox());
}

TEST(Catalog, Json)
{
    Catalog catalog(quiet());
    catalog.add(v.tile());
    catalog.add(tileAt(6, 45));

    const Json::Value json(parse(toFastString(catalog.toJson())));
    ASSERT_TRUE(json.isArray());
    ASSERT_EQ(json.size(), 2u);

    const Catalog loaded(json, quiet());
    EXPECT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.rejected(), 0u);

    const FileMetadata* tile(loaded.find(v.filename));
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->filename(), v.filename);
    EXPECT_EQ(tile->height(), v.size);
    EXPECT_EQ(tile->boundingBox(), v.bounds);
    EXPECT_EQ(tile->noDataValueAsNumber(), -32768.0);
}

TEST(Catalog, OutdatedStrict)
{
    Json::Value json(Json::arrayValue);
    json.append(tileAt(5, 45).toJson());

    Json::Value old(tileAt(6, 45).toJson());
    old["version"] = "2.1";
    json.append(old);

    EXPECT_THROW(Catalog(json, quiet(true)), RegenerationRequired);
}

TEST(Catalog, OutdatedLenient)
{
    Json::Value json(Json::arrayValue);
    json.append(tileAt(5, 45).toJson());

    Json::Value old(tileAt(6, 45).toJson());
    old["version"] = "2.1";
    json.append(old);

    Json::Value future(tileAt(7, 45).toJson());
    future["version"] = "3.0";
    json.append(future);

    const Catalog catalog(json, quiet(false));
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.rejected(), 2u);
    EXPECT_NE(catalog.find("N45E005.hgt"), nullptr);
    EXPECT_EQ(catalog.find("N45E006.hgt"), nullptr);
}

TEST(Catalog, OutdatedLayoutStrict)
{
    Json::Value json(Json::arrayValue);
    json.append(tileAt(5, 45).toJson());
    json.append(parse(recordAt21));

    EXPECT_THROW(Catalog(json, quiet(true)), RegenerationRequired);
}

TEST(Catalog, OutdatedLayoutLenient)
{
    Json::Value json(Json::arrayValue);
    json.append(tileAt(5, 45).toJson());
    json.append(parse(recordAt21));

    Json::Value respelled(tileAt(7, 45).toJson());
    respelled["version"] = "2.2.0";
    json.append(respelled);

    const Catalog catalog(json, quiet(false));
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.rejected(), 2u);
    EXPECT_NE(catalog.find("N45E005.hgt"), nullptr);
    EXPECT_EQ(catalog.find("N45E006.hgt"), nullptr);
    EXPECT_EQ(catalog.find("N45E007.hgt"), nullptr);
}

TEST(Catalog, OutdatedLayoutVerbose)
{
    Json::Value json(Json::arrayValue);
    json.append(parse(recordAt21));

    Json::Value config;
    config["verbose"] = true;
    config["strictVersion"] = false;

    const Catalog catalog(json, Config(config));
    EXPECT_TRUE(catalog.empty());
    EXPECT_EQ(catalog.rejected(), 1u);
}

TEST(Catalog, MissingVersion)
{
    Json::Value entry(tileAt(5, 45).toJson());
    entry.removeMember("version");

    Json::Value json(Json::arrayValue);
    json.append(entry);

    EXPECT_ANY_THROW(Catalog(json, quiet(false)));
}

TEST(Catalog, InvalidJson)
{
    EXPECT_ANY_THROW(Catalog(parse("{}"), quiet()));
    EXPECT_ANY_THROW(Catalog(parse("[1]"), quiet()));
    EXPECT_TRUE(Catalog(Json::Value(), quiet()).empty());
}
