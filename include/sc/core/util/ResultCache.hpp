#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

/**
 * @brief Bounded LRU cache of build results, keyed by item key
 *
 * @tparam T Artifact type produced by the item build operation
 *
 * Artifacts are shared so that a frame already handed out keeps its
 * artifacts alive after eviction; the cache itself drops its reference
 * when an entry is evicted, erased or cleared.
 *
 * Not synchronized. Callers sharing one cache between threads must
 * serialize access.
 */
template<typename T>
class ResultCache
{
public:
    using ArtifactPtr = std::shared_ptr<const T>;

    /**
     * @brief Construct a new Result Cache object
     * @param capacity Maximum number of entries, must be positive
     */
    explicit ResultCache(size_t capacity) : _capacity(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("ResultCache: capacity must be positive");
        }
    }

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Look up an artifact and mark it most recently used
     * @return The artifact, or nullptr on a miss
     */
    ArtifactPtr get(const std::string& key)
    {
        auto it = _index.find(key);
        if (it == _index.end()) {
            _misses++;
            return nullptr;
        }

        _hits++;
        _order.splice(_order.end(), _order, it->second);
        return it->second->artifact;
    }

    /**
     * @brief Read without touching recency or hit/miss counters
     */
    ArtifactPtr peek(const std::string& key) const
    {
        auto it = _index.find(key);
        return it == _index.end() ? nullptr : it->second->artifact;
    }

    bool contains(const std::string& key) const
    {
        return _index.count(key) > 0;
    }

    /**
     * @brief Store an artifact as the most recently used entry
     *
     * Replacing an existing key never evicts. Otherwise, at capacity the
     * least recently used entry is dropped first.
     */
    void put(const std::string& key, ArtifactPtr artifact)
    {
        auto it = _index.find(key);
        if (it != _index.end()) {
            it->second->artifact = std::move(artifact);
            _order.splice(_order.end(), _order, it->second);
            return;
        }

        if (_index.size() >= _capacity) {
            _index.erase(_order.front().key);
            _order.pop_front();
            _evictions++;
        }

        _order.push_back({key, std::move(artifact)});
        _index.emplace(key, std::prev(_order.end()));
    }

    void put(const std::string& key, T artifact)
    {
        put(key, std::make_shared<const T>(std::move(artifact)));
    }

    bool erase(const std::string& key)
    {
        auto it = _index.find(key);
        if (it == _index.end()) {
            return false;
        }
        _order.erase(it->second);
        _index.erase(it);
        return true;
    }

    /**
     * @brief Drop every entry; hit/miss counters are kept
     */
    void clear()
    {
        _index.clear();
        _order.clear();
    }

    void resetStats()
    {
        _hits = 0;
        _misses = 0;
        _evictions = 0;
    }

    size_t size() const { return _index.size(); }
    size_t capacity() const { return _capacity; }
    bool empty() const { return _index.empty(); }

    uint64_t hits() const { return _hits; }
    uint64_t misses() const { return _misses; }
    uint64_t evictions() const { return _evictions; }

    /**
     * @brief hits / (hits + misses), 0 before the first access
     */
    double hitRatio() const
    {
        const uint64_t total = _hits + _misses;
        return total > 0 ? static_cast<double>(_hits) / static_cast<double>(total) : 0.0;
    }

private:
    struct Entry {
        std::string key;
        ArtifactPtr artifact;
    };

    size_t _capacity = 0;
    uint64_t _hits = 0;
    uint64_t _misses = 0;
    uint64_t _evictions = 0;
    // front = least recently used
    std::list<Entry> _order;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> _index;
};
