#include "sc/core/util/Camera.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

static bool finite_point(const cv::Point2d &p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

Camera::Camera(double minZoom, double maxZoom, double minScreenExtent)
    : _minZoom(minZoom), _maxZoom(maxZoom), _minScreenExtent(minScreenExtent)
{
    if (!std::isfinite(minZoom) || !std::isfinite(maxZoom) || minZoom <= 0)
        throw std::invalid_argument("Camera: zoom bounds must be finite and positive");
    if (minZoom > maxZoom)
        throw std::invalid_argument("Camera: minZoom must not exceed maxZoom");
    if (!std::isfinite(minScreenExtent) || minScreenExtent <= 0)
        throw std::invalid_argument("Camera: minScreenExtent must be positive");

    _zoom = clampZoom(1.0);
}

double Camera::clampZoom(double zoom) const
{
    return std::clamp(zoom, _minZoom, _maxZoom);
}

bool Camera::setOrigin(const cv::Point2d &origin)
{
    if (!finite_point(origin) || origin == _origin)
        return false;
    _origin = origin;
    return true;
}

bool Camera::setZoom(double zoom)
{
    if (!std::isfinite(zoom))
        return false;
    const double clamped = clampZoom(zoom);
    if (clamped == _zoom)
        return false;
    _zoom = clamped;
    return true;
}

bool Camera::setCamera(const cv::Point2d &origin, double zoom)
{
    const bool originChanged = setOrigin(origin);
    const bool zoomChanged = setZoom(zoom);
    return originChanged || zoomChanged;
}

bool Camera::pan(const cv::Point2d &worldDelta)
{
    return setOrigin(_origin + worldDelta);
}

bool Camera::panScreen(const cv::Point2d &screenDelta)
{
    return setOrigin(_origin - screenDelta * (1.0 / _zoom));
}

bool Camera::zoomBy(double factor, const cv::Point2d &focalScreen, const cv::Size2d &viewport)
{
    if (!std::isfinite(factor) || factor <= 0 || !finite_point(focalScreen))
        return false;

    const double newZoom = clampZoom(_zoom * factor);
    if (newZoom == _zoom)
        return false;

    cv::Point2d focal = focalScreen;
    if (viewport.width > 0 && viewport.height > 0) {
        focal.x = std::clamp(focal.x, 0.0, viewport.width);
        focal.y = std::clamp(focal.y, 0.0, viewport.height);
    }

    const cv::Point2d worldBefore = screenToWorld(focal);
    _zoom = newZoom;
    const cv::Point2d worldAfter = screenToWorld(focal);
    _origin += worldBefore - worldAfter;
    return true;
}

cv::Rect2d Camera::visibleWorldRect(const cv::Size2d &screenSize) const
{
    return {_origin.x, _origin.y,
            std::max(0.0, screenSize.width) / _zoom,
            std::max(0.0, screenSize.height) / _zoom};
}

cv::Point2d Camera::worldToScreen(const cv::Point2d &world) const
{
    return (world - _origin) * _zoom;
}

cv::Point2d Camera::screenToWorld(const cv::Point2d &screen) const
{
    return _origin + screen * (1.0 / _zoom);
}

cv::Rect2d Camera::worldToScreen(const cv::Rect2d &world) const
{
    const cv::Point2d tl = worldToScreen(world.tl());
    return {tl.x, tl.y,
            std::max(_minScreenExtent, world.width * _zoom),
            std::max(_minScreenExtent, world.height * _zoom)};
}
