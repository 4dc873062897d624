#ifndef KEYSHAPE_PATH_PATH_HPP
#define KEYSHAPE_PATH_PATH_HPP

#include "path_segment.hpp"
#include <geometry/rect.hpp>
#include <math/transform.hpp>
#include <limits>
#include <utility>
#include <vector>

namespace keyshape {

// Bounding box of every pen position visited by the segments. Control points
// are not included. Paths not starting with a Move implicitly start at the
// origin, which is then part of the bounds.
template <typename U>
Rect<U> calculate_bounds(const std::vector<PathSegment<U>>& segments) {
    constexpr float inf = std::numeric_limits<float>::infinity();

    if (segments.empty()) {
        return Rect<U>::empty();
    }

    Rect<U> bounds;
    if (std::holds_alternative<segment::Move<U>>(segments.front())) {
        bounds = Rect<U>(Point<U>::splat(inf), Point<U>::splat(-inf));
    }

    Point<U> pen = Point<U>::origin();
    Point<U> start = pen;
    for (const auto& seg : segments) {
        if (const auto* move = std::get_if<segment::Move<U>>(&seg)) {
            start = move->point;
        }
        pen = advance_pen(seg, pen, start);
        bounds = bounds.including(pen);
    }
    return bounds;
}

// Immutable sequence of path segments with a cached bounding box
template <typename U>
class Path {
public:
    using const_iterator = typename std::vector<PathSegment<U>>::const_iterator;

    Path() = default;
    Path(std::vector<PathSegment<U>> segments, const Rect<U>& bounds)
        : segments_(std::move(segments)), bounds_(bounds) {}

    static Path empty() { return {}; }

    // Concatenate paths, skipping empty ones. A Move to the origin is inserted
    // before any later path that doesn't start with a Move of its own
    static Path from_paths(const std::vector<Path>& paths) {
        std::vector<PathSegment<U>> segments;
        Rect<U> bounds;
        bool first = true;

        for (const Path& path : paths) {
            if (path.is_empty()) {
                continue;
            }
            if (first) {
                bounds = path.bounds_;
                first = false;
            } else {
                if (!std::holds_alternative<segment::Move<U>>(path.segments_.front())) {
                    segments.push_back(segment::Move<U>{Point<U>::origin()});
                }
                bounds = bounds.union_with(path.bounds_);
            }
            segments.insert(segments.end(), path.segments_.begin(), path.segments_.end());
        }

        return Path(std::move(segments), bounds);
    }

    const std::vector<PathSegment<U>>& segments() const { return segments_; }
    const Rect<U>& bounds() const { return bounds_; }

    size_t size() const { return segments_.size(); }
    bool is_empty() const { return segments_.empty(); }

    const PathSegment<U>& operator[](size_t index) const { return segments_[index]; }

    const_iterator begin() const { return segments_.begin(); }
    const_iterator end() const { return segments_.end(); }

    // Scale and translate map the cached bounds directly
    Path scaled(const Scale& scale) const {
        return Path(map_segments(scale),
                    Rect<U>::from_points(scale.apply(bounds_.min), scale.apply(bounds_.max)));
    }

    Path translated(const Translate<U>& translate) const {
        return Path(map_segments(translate), bounds_.translated(translate.to_vector()));
    }

    // Rotation and general transforms recompute the bounds from the segments
    Path rotated(const Rotate& rotate) const {
        auto segments = map_segments(rotate);
        Rect<U> bounds = calculate_bounds(segments);
        return Path(std::move(segments), bounds);
    }

    Path transformed(const Transform<U>& transform) const {
        auto segments = map_segments(transform);
        Rect<U> bounds = calculate_bounds(segments);
        return Path(std::move(segments), bounds);
    }

    bool operator==(const Path& other) const {
        return segments_ == other.segments_ && bounds_ == other.bounds_;
    }

private:
    template <typename Xform>
    std::vector<PathSegment<U>> map_segments(const Xform& xform) const {
        std::vector<PathSegment<U>> result;
        result.reserve(segments_.size());
        for (const auto& seg : segments_) {
            result.push_back(transform_segment(seg, xform));
        }
        return result;
    }

    std::vector<PathSegment<U>> segments_;
    Rect<U> bounds_;
};

template <typename From, typename To>
Path<To> convert(const Path<From>& path, Conversion<From, To> conversion) {
    std::vector<PathSegment<To>> segments;
    segments.reserve(path.size());
    for (const auto& seg : path) {
        segments.push_back(convert(seg, conversion));
    }
    return Path<To>(std::move(segments), convert(path.bounds(), conversion));
}

template <typename U>
bool is_close(const Path<U>& a, const Path<U>& b,
              float rel_tol = approx::REL_TOL, float abs_tol = approx::ABS_TOL) {
    if (a.size() != b.size() || !is_close(a.bounds(), b.bounds(), rel_tol, abs_tol)) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!is_close(a[i], b[i], rel_tol, abs_tol)) {
            return false;
        }
    }
    return true;
}

}  // namespace keyshape

#endif // KEYSHAPE_PATH_PATH_HPP
