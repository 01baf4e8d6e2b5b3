#pragma once
#include <optional>
#include <variant>
#include "Types.hpp"
#include "Value.hpp"

struct StraightCurve
{
    Vec2 p0;
    Vec2 p1;
};

// Angles in radians; the span runs from angle0 to angle1 in either direction.
struct ArcCurve
{
    Vec2 center;
    double radius = 0.0;
    double angle0 = 0.0;
    double angle1 = 0.0;
};

// Cubic Hermite segment; tangents are full-length (not normalised).
struct HermiteCurve
{
    Vec2 p0;
    Vec2 p1;
    Vec2 t0;
    Vec2 t1;
};

using CurveParams = std::variant<StraightCurve, ArcCurve, HermiteCurve>;

class Geometry
{
public:
    static constexpr int ARC_SUBDIVISIONS = 10;
    static constexpr int SPLINE_SUBDIVISIONS = 8;
    static constexpr double DEGENERATE_TANGENT_SQ = 0.01;

    static Polyline sample(CurveParams const& curve);

    static Polyline sampleStraight(StraightCurve const& c);
    static Polyline sampleArc(ArcCurve const& c);
    static Polyline sampleHermite(HermiteCurve const& c);

    // Recognises the curve parameter shapes edges come with:
    //   { center, radius, angle0|startAngle, angle1|endAngle }      -> arc
    //   { p0|pos0, p1|pos1, t0|tangent0, t1|tangent1 }              -> spline
    //   { p0|pos0, p1|pos1 }                                         -> straight
    static std::optional<CurveParams> decode(Value const& params);

    static bool isDegenerate(HermiteCurve const& c) noexcept;
};
