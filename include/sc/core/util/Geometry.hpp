#pragma once

#include <opencv2/core.hpp>

// Rectangle helpers for world and screen space.
// All rects are cv::Rect2d with x/y at the top-left corner.

// Strict overlap: rects that only touch along an edge do not overlap
bool rect_overlaps(const cv::Rect2d &a, const cv::Rect2d &b);

// Closed containment: inner may touch the edges of outer
bool rect_contains(const cv::Rect2d &outer, const cv::Rect2d &inner);

cv::Rect2d rect_union(const cv::Rect2d &a, const cv::Rect2d &b);
cv::Rect2d rect_inflate(const cv::Rect2d &r, double margin);
cv::Point2d rect_center(const cv::Rect2d &r);

// Finite coordinates and non-negative extent
bool rect_valid(const cv::Rect2d &r);

double point_distance(const cv::Point2d &a, const cv::Point2d &b);
