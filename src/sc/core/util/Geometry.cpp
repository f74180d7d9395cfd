#include "sc/core/util/Geometry.hpp"

#include <algorithm>
#include <cmath>

bool rect_overlaps(const cv::Rect2d &a, const cv::Rect2d &b)
{
    return a.x < b.x + b.width && b.x < a.x + a.width &&
           a.y < b.y + b.height && b.y < a.y + a.height;
}

bool rect_contains(const cv::Rect2d &outer, const cv::Rect2d &inner)
{
    return inner.x >= outer.x && inner.y >= outer.y &&
           inner.x + inner.width <= outer.x + outer.width &&
           inner.y + inner.height <= outer.y + outer.height;
}

cv::Rect2d rect_union(const cv::Rect2d &a, const cv::Rect2d &b)
{
    const double x0 = std::min(a.x, b.x);
    const double y0 = std::min(a.y, b.y);
    const double x1 = std::max(a.x + a.width, b.x + b.width);
    const double y1 = std::max(a.y + a.height, b.y + b.height);
    return {x0, y0, x1 - x0, y1 - y0};
}

cv::Rect2d rect_inflate(const cv::Rect2d &r, double margin)
{
    return {r.x - margin, r.y - margin, r.width + 2*margin, r.height + 2*margin};
}

cv::Point2d rect_center(const cv::Rect2d &r)
{
    return {r.x + r.width*0.5, r.y + r.height*0.5};
}

bool rect_valid(const cv::Rect2d &r)
{
    return std::isfinite(r.x) && std::isfinite(r.y) &&
           std::isfinite(r.width) && std::isfinite(r.height) &&
           r.width >= 0 && r.height >= 0;
}

double point_distance(const cv::Point2d &a, const cv::Point2d &b)
{
    const cv::Point2d d = a - b;
    return std::sqrt(d.x*d.x + d.y*d.y);
}
