#include <gtest/gtest.h>
#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

using namespace keyshape;

namespace {

using V = Vector<Unitless>;

constexpr float TOL = 1e-4f;

std::vector<V> ends(const std::vector<BezierTriple<Unitless>>& segments) {
    std::vector<V> result;
    for (const auto& seg : segments) {
        result.push_back(seg.end);
    }
    return result;
}

void expect_ends(const std::vector<BezierTriple<Unitless>>& segments,
                 const std::vector<V>& expected) {
    ASSERT_EQ(segments.size(), expected.size());
    auto actual = ends(segments);
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(actual[i].x, expected[i].x, TOL) << "segment " << i;
        EXPECT_NEAR(actual[i].y, expected[i].y, TOL) << "segment " << i;
    }
}

// 4/3 tan(dphi / 4) for a quarter turn
float quarter_kappa() {
    return 4.0f / 3.0f * Angle::degrees(22.5f).tan();
}

// Angle swept by one segment, read from its end tangents after undoing the
// ellipse rotation and radii so the arc lies on a unit circle
float subtended_degrees(const BezierTriple<Unitless>& seg, const V& radii, float rotation) {
    auto to_circle = [&](const V& v) {
        return v.rotate(Angle::degrees(-rotation)).component_div(radii.abs());
    };
    V start_tangent = to_circle(seg.ctrl1);
    V end_tangent = to_circle(seg.end - seg.ctrl2);
    float cos_angle = start_tangent.dot(end_tangent) /
                      (start_tangent.length() * end_tangent.length());
    return Angle::acos(std::clamp(cos_angle, -1.0f, 1.0f)).to_degrees();
}

// Unit circle arc from angle 0 through sweep_degrees, centre at (-1, 0) from the pen
V chord(float sweep_degrees) {
    Angle sweep = Angle::degrees(sweep_degrees);
    return V(sweep.cos() - 1.0f, sweep.sin());
}

}  // namespace

// ============================================
// Segment Split Tests
// ============================================

TEST(ArcToBezierTest, QuarterArcAllFlagCombinations) {
    V r(1.0f, 1.0f);
    V d(1.0f, 1.0f);

    expect_ends(arc_to_bezier(r, Angle::zero(), false, false, d), {V(1.0f, 1.0f)});
    expect_ends(arc_to_bezier(r, Angle::zero(), true, false, d),
                {V(-1.0f, 1.0f), V(1.0f, 1.0f), V(1.0f, -1.0f)});
    expect_ends(arc_to_bezier(r, Angle::zero(), true, true, d),
                {V(1.0f, -1.0f), V(1.0f, 1.0f), V(-1.0f, 1.0f)});
}

TEST(ArcToBezierTest, LargeSweepDownward) {
    auto segments = arc_to_bezier(V(1.0f, 1.0f), Angle::zero(), true, true, V(1.0f, -1.0f));
    expect_ends(segments, {V(-1.0f, -1.0f), V(1.0f, -1.0f), V(1.0f, 1.0f)});
}

TEST(ArcToBezierTest, EllipticalRadii) {
    auto segments = arc_to_bezier(V(1.0f, 2.0f), Angle::zero(), false, false, V(1.0f, 2.0f));
    expect_ends(segments, {V(1.0f, 2.0f)});
}

TEST(ArcToBezierTest, RotatedEllipse) {
    auto segments = arc_to_bezier(V(1.0f, 2.0f), Angle::degrees(90.0f), false, false,
                                  V(2.0f, -1.0f));
    expect_ends(segments, {V(2.0f, -1.0f)});
}

TEST(ArcToBezierTest, NonQuarterArcs) {
    float r = std::numbers::sqrt2_v<float>;

    expect_ends(arc_to_bezier(V(r, r), Angle::zero(), false, true, V(0.0f, -2.0f)),
                {V(0.0f, -2.0f)});
    expect_ends(arc_to_bezier(V(r, r), Angle::zero(), false, false, V(0.0f, 2.0f)),
                {V(0.0f, 2.0f)});
}

TEST(ArcToBezierTest, HalfCircle) {
    auto segments = arc_to_bezier(V(1.0f, 1.0f), Angle::zero(), false, false, V(2.0f, 0.0f));
    expect_ends(segments, {V(1.0f, 1.0f), V(1.0f, -1.0f)});
}

TEST(ArcToBezierTest, RadiiScaledUpWhenTooSmall) {
    auto segments = arc_to_bezier(V(1.0f, 1.0f), Angle::zero(), false, false, V(4.0f, 0.0f));
    expect_ends(segments, {V(2.0f, 2.0f), V(2.0f, -2.0f)});
}

TEST(ArcToBezierTest, NegativeRadiiUseMagnitude) {
    auto segments = arc_to_bezier(V(-1.0f, -1.0f), Angle::zero(), false, false, V(1.0f, 1.0f));
    expect_ends(segments, {V(1.0f, 1.0f)});
}

// ============================================
// Degenerate Input Tests
// ============================================

TEST(ArcToBezierTest, ZeroRadiusIsStraightLine) {
    auto segments = arc_to_bezier(V(0.0f, 0.0f), Angle::zero(), false, false, V(1.0f, 0.0f));
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_NEAR(segments[0].ctrl1.x, 1.0f / 3.0f, TOL);
    EXPECT_NEAR(segments[0].ctrl1.y, 0.0f, TOL);
    EXPECT_NEAR(segments[0].ctrl2.x, 2.0f / 3.0f, TOL);
    EXPECT_NEAR(segments[0].ctrl2.y, 0.0f, TOL);
    EXPECT_NEAR(segments[0].end.x, 1.0f, TOL);
    EXPECT_NEAR(segments[0].end.y, 0.0f, TOL);

    // One radius is enough
    auto flat = arc_to_bezier(V(1.0f, 0.0f), Angle::zero(), false, false, V(1.0f, 1.0f));
    ASSERT_EQ(flat.size(), 1u);
    EXPECT_NEAR(flat[0].end.x, 1.0f, TOL);
    EXPECT_NEAR(flat[0].end.y, 1.0f, TOL);
}

TEST(ArcToBezierTest, ZeroDisplacementIsEmpty) {
    EXPECT_TRUE(arc_to_bezier(V(1.0f, 1.0f), Angle::zero(), false, false, V(0.0f, 0.0f)).empty());
    EXPECT_TRUE(arc_to_bezier(V(1.0f, 1.0f), Angle::zero(), true, true,
                              V(1e-6f, 0.0f)).empty());
}

TEST(ArcToBezierTest, ToleranceIsRespected) {
    // Radius below a coarse tolerance degenerates to a line
    auto segments = arc_to_bezier(V(0.5f, 0.5f), Angle::zero(), false, false, V(1.0f, 0.0f),
                                  0.75f);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_NEAR(segments[0].ctrl1.x, 1.0f / 3.0f, TOL);
}

// ============================================
// Property Tests
// ============================================

TEST(ArcToBezierTest, SegmentsSumToDisplacement) {
    const std::vector<V> radii = {V(1.0f, 1.0f), V(3.0f, 1.5f), V(0.5f, 2.0f), V(10.0f, 10.0f)};
    const std::vector<V> displacements = {V(1.0f, 0.0f), V(0.0f, -3.0f), V(2.0f, 2.0f),
                                          V(-4.0f, 1.0f), V(0.3f, -0.7f)};
    const std::vector<float> rotations = {0.0f, 30.0f, 90.0f, -45.0f};

    for (const auto& r : radii) {
        for (const auto& d : displacements) {
            for (float rot : rotations) {
                for (int flags = 0; flags < 4; ++flags) {
                    bool large_arc = (flags & 1) != 0;
                    bool sweep = (flags & 2) != 0;
                    auto segments = arc_to_bezier(r, Angle::degrees(rot), large_arc, sweep, d);

                    ASSERT_GE(segments.size(), 1u);
                    ASSERT_LE(segments.size(), 4u);

                    V sum(0.0f, 0.0f);
                    for (const auto& seg : segments) {
                        sum += seg.end;
                        EXPECT_LE(subtended_degrees(seg, r, rot), 90.0f + 1e-2f);
                    }
                    EXPECT_NEAR(sum.x, d.x, 1e-3f);
                    EXPECT_NEAR(sum.y, d.y, 1e-3f);
                }
            }
        }
    }
}

TEST(ArcToBezierTest, QuarterTurnBoundary) {
    V r(1.0f, 1.0f);

    // Within the tolerance of a quarter turn
    auto just_over = arc_to_bezier(r, Angle::zero(), false, true, chord(90.0001f));
    ASSERT_EQ(just_over.size(), 1u);
    EXPECT_NEAR(subtended_degrees(just_over[0], r, 0.0f), 90.0f, 1e-2f);

    auto past = arc_to_bezier(r, Angle::zero(), false, true, chord(90.01f));
    ASSERT_EQ(past.size(), 2u);
    EXPECT_NEAR(subtended_degrees(past[0], r, 0.0f), 45.005f, 1e-2f);

    auto full_half = arc_to_bezier(r, Angle::zero(), false, true, chord(179.9f));
    EXPECT_EQ(full_half.size(), 2u);
}

TEST(ArcToBezierTest, LargeArcUsesMoreSegments) {
    V r(1.0f, 1.0f);
    V d(1.0f, 1.0f);
    EXPECT_LT(arc_to_bezier(r, Angle::zero(), false, true, d).size(),
              arc_to_bezier(r, Angle::zero(), true, true, d).size());
}

TEST(ArcToBezierTest, WorksInAnyUnit) {
    auto segments = arc_to_bezier(Vector<Dot>(65.0f, 65.0f), Angle::zero(), false, true,
                                  Vector<Dot>(65.0f, -65.0f));
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_NEAR(segments[0].end.x, 65.0f, 1e-3f);
    EXPECT_NEAR(segments[0].end.y, -65.0f, 1e-3f);
}

// ============================================
// Centre Tests
// ============================================

TEST(ArcCenterTest, QuarterArc) {
    V r(1.0f, 1.0f);
    V d(1.0f, 1.0f);

    V ff = detail::arc_center(r, false, false, d);
    V tf = detail::arc_center(r, true, false, d);
    V ft = detail::arc_center(r, false, true, d);
    V tt = detail::arc_center(r, true, true, d);

    EXPECT_TRUE(is_close(ff, V(1.0f, 0.0f)));
    EXPECT_TRUE(is_close(tf, V(0.0f, 1.0f)));
    EXPECT_TRUE(is_close(ft, V(0.0f, 1.0f)));
    EXPECT_TRUE(is_close(tt, V(1.0f, 0.0f)));
}

TEST(ArcCenterTest, HalfCircleCentreIsMidpoint) {
    V c = detail::arc_center(V(1.0f, 1.0f), false, false, V(2.0f, 0.0f));
    EXPECT_TRUE(is_close(c, V(1.0f, 0.0f)));
}

// ============================================
// Single Segment Tests
// ============================================

TEST(ArcSegmentTest, UnitCircleQuarter) {
    float a = quarter_kappa();
    auto seg = detail::arc_segment(V(1.0f, 1.0f), Angle::zero(), Angle::degrees(90.0f));

    EXPECT_NEAR(seg.ctrl1.x, 0.0f, TOL);
    EXPECT_NEAR(seg.ctrl1.y, a, TOL);
    EXPECT_NEAR(seg.ctrl2.x, a - 1.0f, TOL);
    EXPECT_NEAR(seg.ctrl2.y, 1.0f, TOL);
    EXPECT_NEAR(seg.end.x, -1.0f, TOL);
    EXPECT_NEAR(seg.end.y, 1.0f, TOL);
}

TEST(ArcSegmentTest, EllipseQuarter) {
    float a = quarter_kappa();
    auto seg = detail::arc_segment(V(2.0f, 1.0f), Angle::zero(), Angle::degrees(90.0f));

    EXPECT_NEAR(seg.ctrl1.x, 0.0f, TOL);
    EXPECT_NEAR(seg.ctrl1.y, a, TOL);
    EXPECT_NEAR(seg.ctrl2.x, 2.0f * (a - 1.0f), TOL);
    EXPECT_NEAR(seg.ctrl2.y, 1.0f, TOL);
    EXPECT_NEAR(seg.end.x, -2.0f, TOL);
    EXPECT_NEAR(seg.end.y, 1.0f, TOL);
}
