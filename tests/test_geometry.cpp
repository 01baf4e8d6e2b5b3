#include <cmath>
#include <numbers>
#include <gtest/gtest.h>
#include "Geometry.hpp"
#include "TestSupport.hpp"

TEST(Geometry, StraightIsTwoEndpoints)
{
    Polyline pts = Geometry::sample(StraightCurve{{0.0, 0.0}, {3.0, 4.0}});
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_DOUBLE_EQ(pts[1].x, 3.0);
    EXPECT_DOUBLE_EQ(pts[1].y, 4.0);
}

TEST(Geometry, NearZeroTangentsFallBackToStraightLine)
{
    HermiteCurve c{{0.0, 0.0}, {10.0, 0.0}, {0.05, 0.05}, {0.0, 0.0}};
    ASSERT_TRUE(Geometry::isDegenerate(c));

    Polyline pts = Geometry::sample(c);
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_DOUBLE_EQ(pts[0].x, 0.0);
    EXPECT_DOUBLE_EQ(pts[0].y, 0.0);
    EXPECT_DOUBLE_EQ(pts[1].x, 10.0);
    EXPECT_DOUBLE_EQ(pts[1].y, 0.0);
}

TEST(Geometry, OneUsableTangentIsNotDegenerate)
{
    HermiteCurve c{{0.0, 0.0}, {10.0, 0.0}, {0.0, 0.0}, {5.0, 5.0}};
    EXPECT_FALSE(Geometry::isDegenerate(c));
    EXPECT_EQ(Geometry::sample(c).size(), static_cast<std::size_t>(Geometry::SPLINE_SUBDIVISIONS + 1));
}

TEST(Geometry, HermiteHitsBothEndpoints)
{
    HermiteCurve c{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {10.0, -10.0}};
    Polyline pts = Geometry::sample(c);

    ASSERT_EQ(pts.size(), 9u);
    EXPECT_NEAR(pts.front().x, 0.0, 1e-9);
    EXPECT_NEAR(pts.back().x, 10.0, 1e-9);
    EXPECT_NEAR(pts.back().y, 0.0, 1e-9);
    // Tangents pull the middle of the curve off the chord.
    EXPECT_GT(pts[4].y, 0.5);
    for (auto const& p : pts)
    {
        EXPECT_TRUE(std::isfinite(p.x));
        EXPECT_TRUE(std::isfinite(p.y));
    }
}

TEST(Geometry, ArcSamplesQuarterCircle)
{
    ArcCurve c{{0.0, 0.0}, 10.0, 0.0, std::numbers::pi / 2.0};
    Polyline pts = Geometry::sample(c);

    ASSERT_EQ(pts.size(), 11u);
    EXPECT_NEAR(pts.front().x, 10.0, 1e-9);
    EXPECT_NEAR(pts.front().y, 0.0, 1e-9);
    EXPECT_NEAR(pts.back().x, 0.0, 1e-9);
    EXPECT_NEAR(pts.back().y, 10.0, 1e-9);
    for (auto const& p : pts)
        EXPECT_NEAR(std::hypot(p.x, p.y), 10.0, 1e-9);
}

TEST(Geometry, DecodeRecognisesParameterShapes)
{
    auto arc = Geometry::decode(record({{"centre", xyz(1.0, 1.0)}, {"radius", 5.0},
                                        {"startAngle", 0.0}, {"endAngle", 1.0}}));
    ASSERT_TRUE(arc);
    EXPECT_TRUE(std::holds_alternative<ArcCurve>(*arc));

    auto spline = Geometry::decode(record({{"pos0", list({0.0, 0.0})}, {"pos1", list({4.0, 0.0})},
                                           {"tangent0", list({1.0, 0.0})}, {"tangent1", list({1.0, 0.0})}}));
    ASSERT_TRUE(spline);
    EXPECT_TRUE(std::holds_alternative<HermiteCurve>(*spline));

    auto straight = Geometry::decode(record({{"p0", xyz(0.0, 0.0)}, {"p1", xyz(1.0, 1.0)}}));
    ASSERT_TRUE(straight);
    EXPECT_TRUE(std::holds_alternative<StraightCurve>(*straight));

    EXPECT_FALSE(Geometry::decode(record({{"radius", 5.0}})));
    EXPECT_FALSE(Geometry::decode(Value(3)));
}
