#include "Geometry.hpp"

#include <cmath>
#include <type_traits>

static double lengthSq(Vec2 const& v) noexcept
{
    return v.x * v.x + v.y * v.y;
}

Polyline Geometry::sample(CurveParams const& curve)
{
    return std::visit([](auto const& c) -> Polyline
    {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, StraightCurve>)
            return sampleStraight(c);
        else if constexpr (std::is_same_v<T, ArcCurve>)
            return sampleArc(c);
        else
            return sampleHermite(c);
    }, curve);
}

Polyline Geometry::sampleStraight(StraightCurve const& c)
{
    return {c.p0, c.p1};
}

Polyline Geometry::sampleArc(ArcCurve const& c)
{
    Polyline out;
    out.reserve(ARC_SUBDIVISIONS + 1);

    double span = c.angle1 - c.angle0;
    for (int i = 0; i <= ARC_SUBDIVISIONS; ++i)
    {
        double a = c.angle0 + span * static_cast<double>(i) / ARC_SUBDIVISIONS;
        out.push_back({c.center.x + c.radius * std::cos(a),
                       c.center.y + c.radius * std::sin(a)});
    }
    return out;
}

bool Geometry::isDegenerate(HermiteCurve const& c) noexcept
{
    return lengthSq(c.t0) < DEGENERATE_TANGENT_SQ && lengthSq(c.t1) < DEGENERATE_TANGENT_SQ;
}

Polyline Geometry::sampleHermite(HermiteCurve const& c)
{
    if (isDegenerate(c))
        return sampleStraight({c.p0, c.p1});

    Polyline out;
    out.reserve(SPLINE_SUBDIVISIONS + 1);

    for (int i = 0; i <= SPLINE_SUBDIVISIONS; ++i)
    {
        double t  = static_cast<double>(i) / SPLINE_SUBDIVISIONS;
        double t2 = t * t;
        double t3 = t2 * t;

        double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
        double h10 = t3 - 2.0 * t2 + t;
        double h01 = -2.0 * t3 + 3.0 * t2;
        double h11 = t3 - t2;

        out.push_back({h00 * c.p0.x + h10 * c.t0.x + h01 * c.p1.x + h11 * c.t1.x,
                       h00 * c.p0.y + h10 * c.t0.y + h01 * c.p1.y + h11 * c.t1.y});
    }
    return out;
}

static std::optional<Vec2> vecField(Value const& params, char const* a, char const* b)
{
    Value const* v = params.field(a);
    if (!v)
        v = params.field(b);
    if (!v)
        return std::nullopt;

    // Curve parameters keep full precision; rounding happens on output.
    Value const* x = v->field("x");
    if (!x) x = v->index(1);
    Value const* y = v->field("y");
    if (!y) y = v->index(2);
    if (!x || !y)
        return std::nullopt;

    auto px = x->asNumber();
    auto py = y->asNumber();
    if (!px || !py)
        return std::nullopt;
    return Vec2{*px, *py};
}

static std::optional<double> numField(Value const& params, char const* a, char const* b)
{
    Value const* v = params.field(a);
    if (!v && b)
        v = params.field(b);
    if (!v)
        return std::nullopt;
    return v->asNumber();
}

std::optional<CurveParams> Geometry::decode(Value const& params)
{
    if (!params.isTable())
        return std::nullopt;

    auto center = vecField(params, "center", "centre");
    auto radius = numField(params, "radius", nullptr);
    auto a0     = numField(params, "angle0", "startAngle");
    auto a1     = numField(params, "angle1", "endAngle");
    if (center && radius && a0 && a1)
        return ArcCurve{*center, *radius, *a0, *a1};

    auto p0 = vecField(params, "p0", "pos0");
    auto p1 = vecField(params, "p1", "pos1");
    if (!p0 || !p1)
        return std::nullopt;

    auto t0 = vecField(params, "t0", "tangent0");
    auto t1 = vecField(params, "t1", "tangent1");
    if (t0 && t1)
        return HermiteCurve{*p0, *p1, *t0, *t1};

    return StraightCurve{*p0, *p1};
}
