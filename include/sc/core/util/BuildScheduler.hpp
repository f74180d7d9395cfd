#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "sc/core/types/CanvasItem.hpp"
#include "sc/core/util/ResultCache.hpp"

struct SchedulerParams {
    int maxBuildsPerTick = 15;
    double tickBudgetMs = 16.0;
};

enum class SchedulerState {
    Idle,
    Building
};

struct BatchResult {
    size_t processed = 0;
    size_t built = 0;
    size_t reused = 0;
    size_t failed = 0;
    double durationMs = 0.0;
    // time between the caller's frame start and the start of this batch
    double startDelayMs = 0.0;
    // this batch finished the task: every target item is ready
    bool completed = false;
};

/**
 * @brief Incremental, deadline-budgeted builder for the visible item set
 *
 * Holds one build task (target list, per-item ready flags, cursor) across
 * ticks. Each tick() processes items from the cursor in target order and
 * returns once maxBuildsPerTick builds were attempted or the budget,
 * counted from the start of the batch, is spent. At least one item is
 * processed per tick.
 *
 * A new target replaces the unprocessed remainder immediately and resets
 * the cursor. Items that were ready in the previous task and appear again
 * (same object) are carried over and only re-checked against the cache.
 * Artifacts already in the cache are never discarded by a retarget.
 *
 * A build that throws is logged and skipped for the current pass. Once
 * the cursor has passed the end, the failed items are retried by the
 * following ticks; the task stays Building until all of them succeed or
 * a new target replaces it.
 */
template<typename T>
class BuildScheduler
{
public:
    using ItemPtr = CanvasItemPtr<T>;
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    BuildScheduler(ResultCache<T>& cache, const SchedulerParams& params = {})
        : _cache(cache), _params(params), _now(&Clock::now)
    {
        if (params.maxBuildsPerTick <= 0) {
            throw std::invalid_argument("BuildScheduler: maxBuildsPerTick must be positive");
        }
        if (!(params.tickBudgetMs > 0)) {
            throw std::invalid_argument("BuildScheduler: tickBudgetMs must be positive");
        }
    }

    void setTimeSource(TimeSource source)
    {
        _now = source ? std::move(source) : TimeSource(&Clock::now);
    }

    void setTarget(std::vector<ItemPtr> items)
    {
        std::unordered_set<const CanvasItem<T>*> carried;
        for (size_t i = 0; i < _target.size(); i++) {
            if (_ready[i]) {
                carried.insert(_target[i].get());
            }
        }

        _target = std::move(items);
        _ready.assign(_target.size(), false);
        _carried.assign(_target.size(), false);
        for (size_t i = 0; i < _target.size(); i++) {
            if (carried.count(_target[i].get())) {
                _ready[i] = true;
                _carried[i] = true;
            }
        }

        _cursor = 0;
        _failed.clear();
        _retry.clear();
        _retryPos = 0;
        _failLogged.assign(_target.size(), false);
        _state = SchedulerState::Building;
    }

    /**
     * @brief Run one batch
     * @param frameStart Start of the current frame, only used for startDelayMs.
     *        The budget is measured from the start of the batch.
     */
    BatchResult tick(Clock::time_point frameStart)
    {
        BatchResult result;
        if (_state == SchedulerState::Idle) {
            return result;
        }

        const auto budget = std::chrono::duration<double, std::milli>(_params.tickBudgetMs);
        const size_t maxBuilds = static_cast<size_t>(_params.maxBuildsPerTick);
        const auto batchStart = _now();
        result.startDelayMs = std::chrono::duration<double, std::milli>(batchStart - frameStart).count();

        while (_cursor < _target.size() || _retryPos < _retry.size()) {
            const size_t attempts = result.built + result.failed;
            if (attempts >= maxBuilds) {
                break;
            }
            if (result.processed > 0 && _now() - batchStart > budget) {
                break;
            }

            if (_cursor < _target.size()) {
                processItem(_cursor, result);
                _cursor++;
            } else {
                processItem(_retry[_retryPos], result);
                _retryPos++;
            }
            result.processed++;
        }

        result.durationMs = std::chrono::duration<double, std::milli>(_now() - batchStart).count();

        if (_cursor >= _target.size() && _retryPos >= _retry.size()) {
            // failures of this pass are retried from the next tick on
            _retry = std::move(_failed);
            _failed.clear();
            _retryPos = 0;
            if (_retry.empty()) {
                _state = SchedulerState::Idle;
                result.completed = true;
            }
        }
        _lastBatch = result;
        return result;
    }

    void reset()
    {
        _target.clear();
        _ready.clear();
        _carried.clear();
        _cursor = 0;
        _failed.clear();
        _retry.clear();
        _retryPos = 0;
        _failLogged.clear();
        _state = SchedulerState::Idle;
        _lastBatch = {};
    }

    SchedulerState state() const { return _state; }
    bool building() const { return _state == SchedulerState::Building; }
    size_t cursor() const { return _cursor; }
    const std::vector<ItemPtr>& target() const { return _target; }
    bool isReady(size_t i) const { return i < _ready.size() && _ready[i]; }
    bool isCarried(size_t i) const { return i < _carried.size() && _carried[i]; }
    const BatchResult& lastBatch() const { return _lastBatch; }
    const SchedulerParams& params() const { return _params; }

    size_t readyCount() const
    {
        size_t n = 0;
        for (bool r : _ready) {
            n += r ? 1 : 0;
        }
        return n;
    }

    // items not yet processed in this pass plus failed items awaiting a retry
    size_t pendingCount() const
    {
        return _target.size() - _cursor + failedCount();
    }

    size_t failedCount() const
    {
        return _failed.size() + (_retry.size() - _retryPos);
    }

private:
    void processItem(size_t i, BatchResult& result)
    {
        const ItemPtr& item = _target[i];

        if (_ready[i]) {
            if (_cache.contains(item->key)) {
                return;
            }
            // evicted or invalidated since it was built
            _ready[i] = false;
        }

        if (_cache.get(item->key)) {
            _ready[i] = true;
            result.reused++;
            return;
        }

        try {
            _cache.put(item->key, item->build(*item));
            _ready[i] = true;
            result.built++;
            return;
        } catch (const std::exception& e) {
            logFailure(i, e.what());
        } catch (...) {
            logFailure(i, "unknown error");
        }
        result.failed++;
        _failed.push_back(i);
    }

    // once per item and task, retries of a broken item stay quiet
    void logFailure(size_t i, const char* what)
    {
        if (_failLogged[i]) {
            return;
        }
        _failLogged[i] = true;
        std::cerr << "WARNING: build failed for item '" << _target[i]->key << "': " << what << '\n';
    }

    ResultCache<T>& _cache;
    SchedulerParams _params;
    TimeSource _now;

    SchedulerState _state = SchedulerState::Idle;
    std::vector<ItemPtr> _target;
    std::vector<bool> _ready;
    std::vector<bool> _carried;
    size_t _cursor = 0;
    // failed in the current pass
    std::vector<size_t> _failed;
    // failed in the previous pass, retried after the cursor reached the end
    std::vector<size_t> _retry;
    size_t _retryPos = 0;
    std::vector<bool> _failLogged;
    BatchResult _lastBatch;
};
