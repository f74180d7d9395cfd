#pragma once

#include <opencv2/core.hpp>

// World-to-screen transform of the canvas viewport.
// origin is the world point at the top-left screen corner, zoom is
// screen pixels per world unit and always stays in [minZoom, maxZoom].
// Mutators return true only when the state actually changed.
class Camera
{
public:
    Camera(double minZoom = 0.1, double maxZoom = 10.0, double minScreenExtent = 1.0);

    const cv::Point2d& origin() const { return _origin; }
    double zoom() const { return _zoom; }
    double minZoom() const { return _minZoom; }
    double maxZoom() const { return _maxZoom; }
    double minScreenExtent() const { return _minScreenExtent; }

    bool setOrigin(const cv::Point2d &origin);
    bool setZoom(double zoom);
    bool setCamera(const cv::Point2d &origin, double zoom);

    bool pan(const cv::Point2d &worldDelta);
    // drag gesture: the content follows the pointer
    bool panScreen(const cv::Point2d &screenDelta);

    // Multiplicative zoom that keeps the world point under focalScreen fixed.
    // The focal point is clamped into the viewport when the viewport is non-empty.
    bool zoomBy(double factor, const cv::Point2d &focalScreen, const cv::Size2d &viewport);

    double clampZoom(double zoom) const;

    cv::Rect2d visibleWorldRect(const cv::Size2d &screenSize) const;

    cv::Point2d worldToScreen(const cv::Point2d &world) const;
    cv::Point2d screenToWorld(const cv::Point2d &screen) const;
    // width/height are floored to minScreenExtent
    cv::Rect2d worldToScreen(const cv::Rect2d &world) const;

private:
    cv::Point2d _origin = {0, 0};
    double _zoom = 1.0;
    double _minZoom;
    double _maxZoom;
    double _minScreenExtent;
};
