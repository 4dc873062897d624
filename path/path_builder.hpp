#ifndef KEYSHAPE_PATH_PATH_BUILDER_HPP
#define KEYSHAPE_PATH_PATH_BUILDER_HPP

#include "arc_to_bezier.hpp"
#include "path.hpp"
#include "path_segment.hpp"
#include <geometry/rect.hpp>
#include <math/angle.hpp>
#include <math/vec2.hpp>
#include <utility>
#include <vector>

namespace keyshape {

// Mutable accumulator for a Path.
//
// Every segment is stored as a displacement from the pen position at the time
// it was appended; the absolute operations just compute that displacement and
// forward to their relative counterparts. Bounds are updated with each new pen
// position only, so curve control points never widen them.
template <typename U>
class PathBuilder {
public:
    explicit PathBuilder(float tolerance = DEFAULT_TOLERANCE) : tolerance_(tolerance) {}

    // Consume the builder
    Path<U> build() {
        return Path<U>(std::move(segments_), bounds_);
    }

    const std::vector<PathSegment<U>>& segments() const { return segments_; }
    const Rect<U>& bounds() const { return bounds_; }
    const Point<U>& pen() const { return pen_; }
    const Point<U>& start() const { return start_; }
    float tolerance() const { return tolerance_; }
    bool is_empty() const { return segments_.empty(); }

    // ========================================================================
    // Relative operations
    // ========================================================================

    void rel_move(const Vector<U>& d) {
        abs_move(pen_ + d);
    }

    void rel_line(const Vector<U>& d) {
        segments_.push_back(segment::Line<U>{d});
        advance(d);
    }

    void rel_horiz_line(Length<U> dx) {
        rel_line(Vector<U>(dx.value, 0.0f));
    }

    void rel_vert_line(Length<U> dy) {
        rel_line(Vector<U>(0.0f, dy.value));
    }

    void rel_cubic_bezier(const Vector<U>& d1, const Vector<U>& d2, const Vector<U>& d) {
        segments_.push_back(segment::CubicBezier<U>{d1, d2, d});
        advance(d);
    }

    // First control point mirrors the previous cubic's second one
    void rel_smooth_cubic_bezier(const Vector<U>& d2, const Vector<U>& d) {
        Vector<U> d1 = Vector<U>::zero();
        if (!segments_.empty()) {
            if (const auto* prev = std::get_if<segment::CubicBezier<U>>(&segments_.back())) {
                d1 = prev->end - prev->ctrl2;
            }
        }
        rel_cubic_bezier(d1, d2, d);
    }

    void rel_quadratic_bezier(const Vector<U>& d1, const Vector<U>& d) {
        segments_.push_back(segment::QuadraticBezier<U>{d1, d});
        advance(d);
    }

    void rel_smooth_quadratic_bezier(const Vector<U>& d) {
        Vector<U> d1 = Vector<U>::zero();
        if (!segments_.empty()) {
            if (const auto* prev = std::get_if<segment::QuadraticBezier<U>>(&segments_.back())) {
                d1 = prev->end - prev->ctrl;
            }
        }
        rel_quadratic_bezier(d1, d);
    }

    // Elliptical arc, appended as 0 to 4 cubic Beziers
    void rel_arc(const Vector<U>& radii, Angle x_rotation, bool large_arc, bool sweep,
                 const Vector<U>& d) {
        auto beziers = arc_to_bezier(radii, x_rotation, large_arc, sweep, d, tolerance_);
        for (const auto& b : beziers) {
            rel_cubic_bezier(b.ctrl1, b.ctrl2, b.end);
        }
    }

    void close() {
        segments_.push_back(segment::Close{});
        pen_ = start_;
    }

    // ========================================================================
    // Absolute operations
    // ========================================================================

    void abs_move(const Point<U>& p) {
        // The first Move replaces the default bounds instead of growing them
        if (segments_.empty()) {
            bounds_ = Rect<U>(p, p);
        } else {
            bounds_ = bounds_.including(p);
        }
        segments_.push_back(segment::Move<U>{p});
        start_ = p;
        pen_ = p;
    }

    void abs_line(const Point<U>& p) {
        rel_line(p - pen_);
    }

    void abs_horiz_line(Length<U> x) {
        rel_horiz_line(x - pen_.length_x());
    }

    void abs_vert_line(Length<U> y) {
        rel_vert_line(y - pen_.length_y());
    }

    void abs_cubic_bezier(const Point<U>& p1, const Point<U>& p2, const Point<U>& p) {
        rel_cubic_bezier(p1 - pen_, p2 - pen_, p - pen_);
    }

    void abs_smooth_cubic_bezier(const Point<U>& p2, const Point<U>& p) {
        rel_smooth_cubic_bezier(p2 - pen_, p - pen_);
    }

    void abs_quadratic_bezier(const Point<U>& p1, const Point<U>& p) {
        rel_quadratic_bezier(p1 - pen_, p - pen_);
    }

    void abs_smooth_quadratic_bezier(const Point<U>& p) {
        rel_smooth_quadratic_bezier(p - pen_);
    }

    void abs_arc(const Vector<U>& radii, Angle x_rotation, bool large_arc, bool sweep,
                 const Point<U>& p) {
        rel_arc(radii, x_rotation, large_arc, sweep, p - pen_);
    }

    // ========================================================================
    // Concatenation
    // ========================================================================

    // Append another builder's segments. Pen and subpath start are taken over
    // from the other builder
    void extend(const PathBuilder& other) {
        if (other.segments_.empty()) {
            return;
        }
        append(other.segments_, other.bounds_);
        start_ = other.start_;
        pen_ = other.pen_;
    }

    // Append a built path. Pen and subpath start are recomputed from the
    // path's last Move
    void extend(const Path<U>& path) {
        if (path.is_empty()) {
            return;
        }
        append(path.segments(), path.bounds());

        const auto& segs = path.segments();
        size_t last_move = 0;
        Point<U> start = Point<U>::origin();
        for (size_t i = segs.size(); i-- > 0;) {
            if (const auto* move = std::get_if<segment::Move<U>>(&segs[i])) {
                last_move = i;
                start = move->point;
                break;
            }
        }

        Point<U> pen = start;
        for (size_t i = last_move; i < segs.size(); ++i) {
            pen = advance_pen(segs[i], pen, start);
        }
        start_ = start;
        pen_ = pen;
    }

private:
    void advance(const Vector<U>& d) {
        pen_ += d;
        bounds_ = bounds_.including(pen_);
    }

    void append(const std::vector<PathSegment<U>>& segments, const Rect<U>& bounds) {
        bool was_empty = segments_.empty();

        // Keep unrelated sub-shapes from being joined by an implicit line
        if (!std::holds_alternative<segment::Move<U>>(segments.front())) {
            segments_.push_back(segment::Move<U>{Point<U>::origin()});
        }
        segments_.insert(segments_.end(), segments.begin(), segments.end());
        bounds_ = was_empty ? bounds : bounds_.union_with(bounds);
    }

    std::vector<PathSegment<U>> segments_;
    Point<U> start_;
    Point<U> pen_;
    Rect<U> bounds_;
    float tolerance_;
};

}  // namespace keyshape

#endif // KEYSHAPE_PATH_PATH_BUILDER_HPP
