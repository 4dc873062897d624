#include <gtest/gtest.h>
#include "geometry.hpp"

#include <vector>

using namespace keyshape;

namespace {

Path<Dot> unit_rect_path() {
    return to_path(Rect<Dot>(Point<Dot>(1.0f, 2.0f), Point<Dot>(3.0f, 4.0f)));
}

}  // namespace

// ============================================
// calculate_bounds Tests
// ============================================

TEST(CalculateBoundsTest, Empty) {
    EXPECT_EQ(calculate_bounds(std::vector<PathSegment<Dot>>{}), Rect<Dot>::empty());
}

TEST(CalculateBoundsTest, LeadingMoveExcludesOrigin) {
    std::vector<PathSegment<Dot>> segments = {
        segment::Move<Dot>{Point<Dot>(5.0f, 5.0f)},
        segment::Line<Dot>{Vector<Dot>(1.0f, 0.0f)},
    };
    EXPECT_EQ(calculate_bounds(segments),
              Rect<Dot>(Point<Dot>(5.0f, 5.0f), Point<Dot>(6.0f, 5.0f)));
}

TEST(CalculateBoundsTest, NoMoveStartsAtOrigin) {
    std::vector<PathSegment<Dot>> segments = {
        segment::Line<Dot>{Vector<Dot>(1.0f, 1.0f)},
    };
    EXPECT_EQ(calculate_bounds(segments),
              Rect<Dot>(Point<Dot>(0.0f, 0.0f), Point<Dot>(1.0f, 1.0f)));
}

TEST(CalculateBoundsTest, CloseReturnsToStart) {
    std::vector<PathSegment<Dot>> segments = {
        segment::Move<Dot>{Point<Dot>(0.0f, 0.0f)},
        segment::Line<Dot>{Vector<Dot>(2.0f, 0.0f)},
        segment::Close{},
        segment::Line<Dot>{Vector<Dot>(0.0f, -3.0f)},
    };
    EXPECT_EQ(calculate_bounds(segments),
              Rect<Dot>(Point<Dot>(0.0f, -3.0f), Point<Dot>(2.0f, 0.0f)));
}

// ============================================
// Path Tests
// ============================================

TEST(PathTest, FromPathsInsertsMove) {
    PathBuilder<Dot> a;
    a.abs_move(Point<Dot>(0.0f, 0.0f));
    a.rel_line(Vector<Dot>(1.0f, 1.0f));

    Path<Dot> b({segment::Line<Dot>{Vector<Dot>(2.0f, 0.0f)}},
                Rect<Dot>(Point<Dot>(0.0f, 0.0f), Point<Dot>(2.0f, 0.0f)));

    Path<Dot> joined = Path<Dot>::from_paths({a.build(), b});
    ASSERT_EQ(joined.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<segment::Move<Dot>>(joined[2]));
    EXPECT_EQ(std::get<segment::Move<Dot>>(joined[2]).point, Point<Dot>::origin());
    EXPECT_EQ(joined.bounds(), Rect<Dot>(Point<Dot>(0.0f, 0.0f), Point<Dot>(2.0f, 1.0f)));
}

TEST(PathTest, FromPathsKeepsExistingMoves) {
    Path<Dot> a = unit_rect_path();
    Path<Dot> b = unit_rect_path().translated(Translate<Dot>(10.0f, 0.0f));

    Path<Dot> joined = Path<Dot>::from_paths({a, b});
    EXPECT_EQ(joined.size(), a.size() + b.size());
    EXPECT_EQ(joined.bounds(), Rect<Dot>(Point<Dot>(1.0f, 2.0f), Point<Dot>(13.0f, 4.0f)));
}

TEST(PathTest, FromNoPathsIsEmpty) {
    Path<Dot> joined = Path<Dot>::from_paths({});
    EXPECT_TRUE(joined.is_empty());
    EXPECT_EQ(joined.bounds(), Rect<Dot>::empty());
}

TEST(PathTest, FromPathsSkipsEmptyPaths) {
    PathBuilder<Dot> builder;
    builder.abs_move(Point<Dot>(100.0f, 100.0f));
    builder.abs_line(Point<Dot>(10.0f, 10.0f));
    Path<Dot> p = builder.build();

    Path<Dot> leading = Path<Dot>::from_paths({Path<Dot>::empty(), p});
    EXPECT_EQ(leading.size(), 2u);
    EXPECT_EQ(leading.bounds(), calculate_bounds(leading.segments()));
    EXPECT_EQ(leading.bounds(), Rect<Dot>(Point<Dot>(10.0f, 10.0f), Point<Dot>(100.0f, 100.0f)));

    Path<Dot> trailing = Path<Dot>::from_paths({p, Path<Dot>::empty()});
    EXPECT_EQ(trailing.size(), 2u);
    EXPECT_EQ(trailing.bounds(), calculate_bounds(trailing.segments()));
    EXPECT_EQ(trailing, p);

    Path<Dot> all_empty = Path<Dot>::from_paths({Path<Dot>::empty(), Path<Dot>::empty()});
    EXPECT_TRUE(all_empty.is_empty());
    EXPECT_EQ(all_empty.bounds(), Rect<Dot>::empty());
}

TEST(PathTest, Iteration) {
    Path<Dot> path = unit_rect_path();
    size_t count = 0;
    for (const auto& seg : path) {
        (void)seg;
        ++count;
    }
    EXPECT_EQ(count, path.size());
    EXPECT_EQ(path.segments().size(), path.size());
}

// ============================================
// Transform Tests
// ============================================

TEST(PathTest, Scaled) {
    Path<Dot> scaled = unit_rect_path().scaled(Scale(2.0f, -1.0f));

    EXPECT_EQ(scaled.bounds(), Rect<Dot>(Point<Dot>(2.0f, -4.0f), Point<Dot>(6.0f, -2.0f)));
    EXPECT_EQ(scaled.bounds(), calculate_bounds(scaled.segments()));
    EXPECT_EQ(std::get<segment::Line<Dot>>(scaled[1]).end, Vector<Dot>(4.0f, 0.0f));
}

TEST(PathTest, Translated) {
    Path<Dot> moved = unit_rect_path().translated(Translate<Dot>(Vector<Dot>(-1.0f, 5.0f)));

    EXPECT_EQ(moved.bounds(), Rect<Dot>(Point<Dot>(0.0f, 7.0f), Point<Dot>(2.0f, 9.0f)));
    EXPECT_EQ(moved.bounds(), calculate_bounds(moved.segments()));

    // Displacements are unchanged
    EXPECT_EQ(std::get<segment::Line<Dot>>(moved[1]).end, Vector<Dot>(2.0f, 0.0f));
}

TEST(PathTest, Rotated) {
    Path<Dot> rotated = unit_rect_path().rotated(Rotate(Angle::degrees(90.0f)));

    EXPECT_TRUE(is_close(rotated.bounds(),
                         Rect<Dot>(Point<Dot>(-4.0f, 1.0f), Point<Dot>(-2.0f, 3.0f))));
    EXPECT_EQ(rotated.bounds(), calculate_bounds(rotated.segments()));
}

TEST(PathTest, Transformed) {
    Transform<Dot> t = Scale(2.0f, 2.0f).to_transform<Dot>()
        .then(Rotate(Angle::degrees(30.0f)).to_transform<Dot>())
        .then(Translate<Dot>(5.0f, -5.0f).to_transform());

    Path<Dot> path = to_path(Circle<Dot>(Point<Dot>(0.0f, 0.0f), Length<Dot>(10.0f)));
    Path<Dot> transformed = path.transformed(t);

    EXPECT_EQ(transformed.size(), path.size());
    EXPECT_EQ(transformed.bounds(), calculate_bounds(transformed.segments()));
}

TEST(PathTest, ConvertUnits) {
    Path<KeyUnit> path = to_path(Rect<KeyUnit>(Point<KeyUnit>(0.0f, 0.0f),
                                               Point<KeyUnit>(1.0f, 1.0f)));
    Path<Dot> dots = convert(path, DOT_PER_UNIT);

    EXPECT_EQ(dots.size(), path.size());
    EXPECT_EQ(dots.bounds(), Rect<Dot>(Point<Dot>(0.0f, 0.0f), Point<Dot>(1000.0f, 1000.0f)));
    EXPECT_EQ(std::get<segment::Line<Dot>>(dots[1]).end, Vector<Dot>(1000.0f, 0.0f));
}

TEST(PathTest, Equality) {
    EXPECT_EQ(unit_rect_path(), unit_rect_path());
    EXPECT_FALSE(unit_rect_path() == unit_rect_path().translated(Translate<Dot>(1.0f, 0.0f)));
    EXPECT_TRUE(is_close(unit_rect_path(), unit_rect_path()));
}
