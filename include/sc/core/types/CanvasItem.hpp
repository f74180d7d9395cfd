#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

// Positioned visual item in world space.
// build is supplied by the caller and may be expensive; the engine only
// ever calls it for items that are visible and not yet cached.
template<typename Artifact>
struct CanvasItem {
    using BuildFn = std::function<Artifact(const CanvasItem&)>;

    std::string key;
    cv::Rect2d rect;
    bool clusterable = false;
    // higher priority items are scheduled first
    int priority = 0;
    BuildFn build;
};

template<typename Artifact>
using CanvasItemPtr = std::shared_ptr<const CanvasItem<Artifact>>;

template<typename Artifact>
struct RenderEntry {
    CanvasItemPtr<Artifact> item;
    std::shared_ptr<const Artifact> artifact;
    cv::Rect2d screenRect;
    // >1 when the item stands in for a collapsed cluster
    size_t memberCount = 1;
};

template<typename Artifact>
struct RenderFrame {
    std::vector<RenderEntry<Artifact>> items;
    size_t visibleCount = 0;
    size_t targetCount = 0;
    size_t totalCount = 0;
    size_t pendingCount = 0;
    size_t builtThisTick = 0;
    size_t failedThisTick = 0;
    double cacheHitRatio = 0.0;
    double batchDurationMs = 0.0;
    double zoom = 1.0;
    // every item of the current visible set is built and in the frame
    bool complete = true;
    uint64_t frameIndex = 0;
};
