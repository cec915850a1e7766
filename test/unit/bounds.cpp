#include "gtest/gtest.h"

#include <demtile/types/bounds.hpp>
#include <demtile/util/json.hpp>

using namespace demtile;

TEST(BoundingBox, Normalized)
{
    const BoundingBox b(6.0, 5.0, 46.0, 45.0);
    EXPECT_EQ(b.minLon(), 5.0);
    EXPECT_EQ(b.maxLon(), 6.0);
    EXPECT_EQ(b.minLat(), 45.0);
    EXPECT_EQ(b.maxLat(), 46.0);
    EXPECT_EQ(b, BoundingBox(5.0, 6.0, 45.0, 46.0));
    EXPECT_DOUBLE_EQ(b.area(), 1.0);
    EXPECT_DOUBLE_EQ(b.midLon(), 5.5);
    EXPECT_DOUBLE_EQ(b.midLat(), 45.5);
}

TEST(BoundingBox, Degenerate)
{
    const BoundingBox b;
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(b, BoundingBox(0, 0, 0, 0));
    EXPECT_TRUE(b.contains(0, 0));
}

TEST(BoundingBox, Relations)
{
    const BoundingBox a(5, 6, 45, 46);
    const BoundingBox east(6, 7, 45, 46);
    const BoundingBox far(10, 11, 45, 46);
    const BoundingBox inner(5.25, 5.75, 45.25, 45.75);

    EXPECT_TRUE(a.intersects(east));
    EXPECT_TRUE(east.intersects(a));
    EXPECT_FALSE(a.intersects(far));
    EXPECT_TRUE(a.contains(inner));
    EXPECT_FALSE(inner.contains(a));
    EXPECT_FALSE(a.contains(east));

    BoundingBox grown(a);
    grown.grow(far);
    EXPECT_EQ(grown, BoundingBox(5, 11, 45, 46));
}

TEST(BoundingBox, Json)
{
    const BoundingBox a(5, 6, 45, 46);
    const Json::Value json(a.toJson());
    ASSERT_TRUE(json.isArray());
    ASSERT_EQ(json.size(), 4u);
    EXPECT_EQ(json[0].asDouble(), 5.0);
    EXPECT_EQ(json[1].asDouble(), 45.0);
    EXPECT_EQ(json[2].asDouble(), 6.0);
    EXPECT_EQ(json[3].asDouble(), 46.0);

    EXPECT_EQ(BoundingBox(json), a);
    EXPECT_EQ(BoundingBox(Json::Value()), BoundingBox());
    EXPECT_ANY_THROW(BoundingBox(parse("[1, 2, 3]")));
    EXPECT_ANY_THROW(BoundingBox(parse("[1, 2, 3, \"x\"]")));
}

TEST(BoundingBox, String)
{
    EXPECT_EQ(
            BoundingBox(5, 6, 45, 46).toString(),
            "Lon: [5.000000, 6.000000], Lat: [45.000000, 46.000000]");
}
