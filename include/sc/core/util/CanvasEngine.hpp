#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "sc/core/types/CanvasItem.hpp"
#include "sc/core/util/BuildScheduler.hpp"
#include "sc/core/util/Camera.hpp"
#include "sc/core/util/EngineConfig.hpp"
#include "sc/core/util/Geometry.hpp"
#include "sc/core/util/LevelOfDetail.hpp"
#include "sc/core/util/QuadTreeIndex.hpp"
#include "sc/core/util/ResultCache.hpp"

/**
 * @brief Viewport culling and incremental build engine for a sparse canvas
 *
 * @tparam T Artifact type produced by the item build operations
 *
 * Single-threaded and tick driven: camera and item changes only mark
 * state dirty, the work happens in tick(). Per tick the engine
 *  - rebuilds the spatial index if the item set changed,
 *  - recomputes the visible set when the view changed (index query, level
 *    of detail, priority order) and retargets the scheduler when that set
 *    differs from the current one,
 *  - runs one budgeted scheduler batch,
 *  - assembles the frame from the artifacts that are ready.
 */
template<typename T>
class CanvasEngine
{
public:
    using Item = CanvasItem<T>;
    using ItemPtr = CanvasItemPtr<T>;
    using Frame = RenderFrame<T>;
    using Clock = std::chrono::steady_clock;

    explicit CanvasEngine(const EngineConfig& config = {})
        : _config(validated(config)),
          _camera(config.minZoom, config.maxZoom, config.minScreenExtent),
          _lod(config.lodParams()),
          _cache(config.cacheCapacity),
          _scheduler(_cache, config.schedulerParams())
    {
        _camera.setZoom(config.initialZoom);
    }

    CanvasEngine(const CanvasEngine&) = delete;
    CanvasEngine& operator=(const CanvasEngine&) = delete;

    /**
     * @brief Replace the dataset
     *
     * The index is rebuilt lazily on the next tick. Cached artifacts and
     * the scheduler task belong to the old dataset and are dropped.
     * Items with a duplicate key, an invalid rect or no build operation
     * are skipped.
     * @return Number of items accepted
     */
    size_t submitItems(std::vector<Item> items)
    {
        _items.clear();
        _items.reserve(items.size());

        std::unordered_set<std::string> keys;
        size_t rejected = 0;
        for (auto& item : items) {
            if (!item.build || !rect_valid(item.rect) || !keys.insert(item.key).second) {
                std::cerr << "WARNING: skipping canvas item '" << item.key << "'" << '\n';
                rejected++;
                continue;
            }
            _items.push_back(std::make_shared<const Item>(std::move(item)));
        }
        if (rejected > 0) {
            std::cerr << "WARNING: " << rejected << " of " << items.size() << " canvas items rejected" << '\n';
        }

        _cache.clear();
        _scheduler.reset();
        _targetMembers.clear();
        _indexDirty = true;
        _viewDirty = true;
        return _items.size();
    }

    bool setCamera(const cv::Point2d& origin, double zoom)
    {
        const double before = _camera.zoom();
        return noteCameraChange(_camera.setCamera(origin, zoom), before);
    }

    bool pan(const cv::Point2d& worldDelta)
    {
        return noteCameraChange(_camera.pan(worldDelta), _camera.zoom());
    }

    bool panScreen(const cv::Point2d& screenDelta)
    {
        return noteCameraChange(_camera.panScreen(screenDelta), _camera.zoom());
    }

    bool zoomAt(double factor, const cv::Point2d& focalScreen, const cv::Size2d& viewport)
    {
        const double before = _camera.zoom();
        bool changed = _camera.zoomBy(factor, focalScreen, viewport);
        if (viewport.width > 0 && viewport.height > 0 && viewport != _viewport) {
            _viewport = viewport;
            _viewDirty = true;
            changed = true;
        }
        return noteCameraChange(changed, before);
    }

    bool setViewportSize(const cv::Size2d& viewport)
    {
        if (!(viewport.width >= 0) || !(viewport.height >= 0) || viewport == _viewport) {
            return false;
        }
        _viewport = viewport;
        _viewDirty = true;
        return true;
    }

    void setTimeSource(typename BuildScheduler<T>::TimeSource source)
    {
        _scheduler.setTimeSource(std::move(source));
    }

    Frame tick(Clock::time_point now)
    {
        if (_indexDirty) {
            rebuildIndex();
        }
        if (_viewDirty) {
            updateTarget();
        }

        const BatchResult batch = _scheduler.tick(now);

        Frame frame;
        frame.frameIndex = ++_frameCounter;
        frame.zoom = _camera.zoom();
        frame.targetCount = _scheduler.target().size();
        frame.totalCount = totalCount();
        frame.pendingCount = _scheduler.pendingCount();
        frame.builtThisTick = batch.built;
        frame.failedThisTick = batch.failed;
        frame.batchDurationMs = batch.durationMs;

        const auto& target = _scheduler.target();
        frame.items.reserve(target.size());
        for (size_t i = 0; i < target.size(); i++) {
            if (!_scheduler.isReady(i)) {
                continue;
            }
            auto artifact = _cache.peek(target[i]->key);
            if (!artifact) {
                continue;
            }
            frame.items.push_back({target[i], std::move(artifact),
                                   _camera.worldToScreen(target[i]->rect),
                                   i < _targetMembers.size() ? _targetMembers[i] : 1});
        }
        frame.visibleCount = frame.items.size();
        // a target larger than the cache loses entries to eviction
        frame.complete = !_scheduler.building() && frame.visibleCount == frame.targetCount;
        frame.cacheHitRatio = _cache.hitRatio();
        return frame;
    }

    size_t totalCount() const
    {
        return _index ? _index->totalCount() : 0;
    }

    const Camera& camera() const { return _camera; }
    const EngineConfig& config() const { return _config; }
    const ResultCache<T>& cache() const { return _cache; }
    const BuildScheduler<T>& scheduler() const { return _scheduler; }
    const QuadTreeIndex* index() const { return _index ? &*_index : nullptr; }
    const std::vector<ItemPtr>& items() const { return _items; }
    const cv::Size2d& viewportSize() const { return _viewport; }
    cv::Rect2d visibleWorldRect() const { return _camera.visibleWorldRect(_viewport); }

private:
    static const EngineConfig& validated(const EngineConfig& config)
    {
        config.validate();
        return config;
    }

    bool noteCameraChange(bool changed, double zoomBefore)
    {
        if (!changed) {
            return false;
        }
        // artifacts are rendered for one scale
        if (_camera.zoom() != zoomBefore) {
            _cache.clear();
            _retarget = true;
        }
        _viewDirty = true;
        return true;
    }

    void rebuildIndex()
    {
        _indexDirty = false;
        if (_items.empty()) {
            _index.reset();
            return;
        }

        std::vector<QuadTreeIndex::Entry> entries;
        entries.reserve(_items.size());
        cv::Rect2d bounds = _items[0]->rect;
        for (size_t i = 0; i < _items.size(); i++) {
            bounds = rect_union(bounds, _items[i]->rect);
            entries.push_back({static_cast<uint64_t>(i), _items[i]->rect});
        }
        bounds = rect_inflate(bounds, _config.indexMargin);
        // a world of identical points still needs an area to split
        if (bounds.width <= 0 || bounds.height <= 0) {
            bounds = rect_inflate(bounds, 1.0);
        }

        if (_index) {
            _index->rebuild(bounds, entries);
        } else {
            _index.emplace(bounds, _config.maxItemsPerNode, _config.maxDepth);
            for (const auto& e : entries) {
                _index->insert(e.id, e.rect);
            }
        }

        const size_t indexed = _index->totalCount();
        if (indexed != _items.size()) {
            std::cerr << "WARNING: " << _items.size() - indexed << " canvas items outside index bounds" << '\n';
        }
    }

    void updateTarget()
    {
        _viewDirty = false;
        const bool forced = _retarget;
        _retarget = false;

        std::vector<LodCandidate> candidates;
        if (_index) {
            const auto hits = _index->query(_camera.visibleWorldRect(_viewport));
            candidates.reserve(hits.size());
            for (const auto& h : hits) {
                candidates.push_back({h.id, h.rect, _items[h.id]->clusterable, 1});
            }
        }

        const LodResult reduced = _lod.reduce(candidates, _camera.zoom());

        std::vector<std::pair<ItemPtr, size_t>> visible;
        visible.reserve(reduced.items.size());
        for (const auto& c : reduced.items) {
            visible.emplace_back(_items[c.id], c.memberCount);
        }
        std::stable_sort(visible.begin(), visible.end(),
                         [](const auto& a, const auto& b) { return a.first->priority > b.first->priority; });

        std::vector<size_t> members;
        members.reserve(visible.size());
        bool same = !forced && visible.size() == _scheduler.target().size();
        for (size_t i = 0; i < visible.size(); i++) {
            members.push_back(visible[i].second);
            if (same && visible[i].first != _scheduler.target()[i]) {
                same = false;
            }
        }
        if (same && members == _targetMembers) {
            return;
        }

        std::vector<ItemPtr> target;
        target.reserve(visible.size());
        for (auto& v : visible) {
            target.push_back(std::move(v.first));
        }
        if (target.size() > _cache.capacity()) {
            std::cerr << "WARNING: " << target.size() << " visible items exceed the cache capacity of "
                      << _cache.capacity() << ", frames stay incomplete" << '\n';
        }
        _targetMembers = std::move(members);
        _scheduler.setTarget(std::move(target));
    }

    EngineConfig _config;
    Camera _camera;
    LevelOfDetailReducer _lod;
    ResultCache<T> _cache;
    BuildScheduler<T> _scheduler;

    std::vector<ItemPtr> _items;
    std::optional<QuadTreeIndex> _index;
    std::vector<size_t> _targetMembers;
    cv::Size2d _viewport = {0, 0};

    bool _indexDirty = true;
    bool _viewDirty = true;
    // cache was invalidated, the current target has to be rebuilt
    bool _retarget = false;
    uint64_t _frameCounter = 0;
};
