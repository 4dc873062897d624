#include <gtest/gtest.h>
#include "geometry.hpp"

#include <vector>

using namespace keyshape;

namespace {

constexpr float TOL = 1e-4f;

template <typename U>
void expect_segments(const Path<U>& path, const std::vector<PathSegment<U>>& expected) {
    ASSERT_EQ(path.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_TRUE(is_close(path[i], expected[i], TOL, TOL)) << "segment " << i;
    }
}

float quarter_kappa() {
    return 4.0f / 3.0f * Angle::degrees(22.5f).tan();
}

}  // namespace

TEST(ToPathTest, Rect) {
    Rect<Mm> rect(Point<Mm>(1.0f, 2.0f), Point<Mm>(3.0f, 4.0f));
    Path<Mm> path = to_path(rect);

    expect_segments(path, {
        segment::Move<Mm>{Point<Mm>(1.0f, 2.0f)},
        segment::Line<Mm>{Vector<Mm>(2.0f, 0.0f)},
        segment::Line<Mm>{Vector<Mm>(0.0f, 2.0f)},
        segment::Line<Mm>{Vector<Mm>(-2.0f, 0.0f)},
        segment::Close{},
    });
    EXPECT_EQ(path.bounds(), rect);
}

TEST(ToPathTest, RoundRect) {
    RoundRect<Mm> rect(Point<Mm>(2.0f, 4.0f), Point<Mm>(6.0f, 8.0f), Vector<Mm>(1.0f, 1.0f));
    Path<Mm> path = to_path(rect);

    float a = quarter_kappa();
    expect_segments(path, {
        segment::Move<Mm>{Point<Mm>(2.0f, 5.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(0.0f, -a), Vector<Mm>(1.0f - a, -1.0f),
                                 Vector<Mm>(1.0f, -1.0f)},
        segment::Line<Mm>{Vector<Mm>(2.0f, 0.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(a, 0.0f), Vector<Mm>(1.0f, 1.0f - a),
                                 Vector<Mm>(1.0f, 1.0f)},
        segment::Line<Mm>{Vector<Mm>(0.0f, 2.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(0.0f, a), Vector<Mm>(-(1.0f - a), 1.0f),
                                 Vector<Mm>(-1.0f, 1.0f)},
        segment::Line<Mm>{Vector<Mm>(-2.0f, 0.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(-a, 0.0f), Vector<Mm>(-1.0f, -(1.0f - a)),
                                 Vector<Mm>(-1.0f, -1.0f)},
        segment::Close{},
    });
    EXPECT_TRUE(is_close(path.bounds(), rect.rect(), TOL, TOL));
}

TEST(ToPathTest, RoundRectWithZeroRadiusIsRect) {
    Rect<Dot> rect(Point<Dot>(0.0f, 0.0f), Point<Dot>(10.0f, 5.0f));
    Path<Dot> rounded = to_path(RoundRect<Dot>(rect, Vector<Dot>(0.0f, 0.0f)));

    EXPECT_TRUE(is_close(rounded, to_path(rect)));
}

TEST(ToPathTest, Circle) {
    Circle<Mm> circle(Point<Mm>(1.5f, 2.0f), Length<Mm>(1.0f));
    Path<Mm> path = to_path(circle);

    float a = quarter_kappa();
    expect_segments(path, {
        segment::Move<Mm>{Point<Mm>(0.5f, 2.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(0.0f, -a), Vector<Mm>(1.0f - a, -1.0f),
                                 Vector<Mm>(1.0f, -1.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(a, 0.0f), Vector<Mm>(1.0f, 1.0f - a),
                                 Vector<Mm>(1.0f, 1.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(0.0f, a), Vector<Mm>(-(1.0f - a), 1.0f),
                                 Vector<Mm>(-1.0f, 1.0f)},
        segment::CubicBezier<Mm>{Vector<Mm>(-a, 0.0f), Vector<Mm>(-1.0f, -(1.0f - a)),
                                 Vector<Mm>(-1.0f, -1.0f)},
        segment::Close{},
    });
    EXPECT_TRUE(is_close(path.bounds(),
                         Rect<Mm>(Point<Mm>(0.5f, 1.0f), Point<Mm>(2.5f, 3.0f)), TOL, TOL));
}

TEST(ToPathTest, Ellipse) {
    Ellipse<Dot> ellipse(Point<Dot>(0.0f, 0.0f), Vector<Dot>(2.0f, 1.0f));
    Path<Dot> path = to_path(ellipse);

    ASSERT_EQ(path.size(), 6u);
    EXPECT_TRUE(std::holds_alternative<segment::Move<Dot>>(path[0]));
    for (size_t i = 1; i < 5; ++i) {
        EXPECT_TRUE(std::holds_alternative<segment::CubicBezier<Dot>>(path[i]));
    }
    EXPECT_TRUE(std::holds_alternative<segment::Close>(path[5]));

    const auto& first = std::get<segment::CubicBezier<Dot>>(path[1]);
    EXPECT_TRUE(is_close(first.end, Vector<Dot>(2.0f, -1.0f), TOL, TOL));
    EXPECT_TRUE(is_close(path.bounds(), ellipse.bounds(), TOL, TOL));
}

TEST(ToPathTest, EllipticalArcIsOpen) {
    EllipticalArc<Dot> arc{Point<Dot>(0.0f, 0.0f), Point<Dot>(2.0f, 0.0f),
                           Vector<Dot>(1.0f, 1.0f), Angle::zero(), false, false};
    Path<Dot> path = to_path(arc);

    ASSERT_EQ(path.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<segment::Move<Dot>>(path[0]));
    EXPECT_FALSE(std::holds_alternative<segment::Close>(path[2]));
    EXPECT_TRUE(is_close(path.bounds(),
                         Rect<Dot>(Point<Dot>(0.0f, 0.0f), Point<Dot>(2.0f, 1.0f)), TOL, TOL));
}

TEST(ToPathTest, ToleranceIsForwarded) {
    // Radii below the tolerance turn the corner arcs into straight cubics
    RoundRect<Dot> rect(Point<Dot>(0.0f, 0.0f), Point<Dot>(100.0f, 100.0f),
                        Vector<Dot>(5.0f, 5.0f));
    Path<Dot> path = to_path(rect, 6.0f);

    ASSERT_EQ(path.size(), 10u);
    for (const auto& seg : path) {
        if (const auto* cubic = std::get_if<segment::CubicBezier<Dot>>(&seg)) {
            EXPECT_TRUE(is_close(cubic->ctrl1, cubic->end / 3.0f, TOL, TOL));
            EXPECT_TRUE(is_close(cubic->ctrl2, cubic->end * (2.0f / 3.0f), TOL, TOL));
        }
    }
    EXPECT_TRUE(is_close(path.bounds(), rect.rect(), TOL, TOL));
}
