#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

/**
 * @brief Region quadtree over world-space rectangles
 *
 * Entries are (id, rect) pairs; the id is chosen by the caller. The root
 * bounds are fixed at construction: a world that outgrows them needs a
 * rebuild() with new bounds, the tree never grows online.
 *
 * A node keeps up to maxItemsPerNode entries of its own. Once that is
 * exceeded (and the node is above maxDepth) it splits into four equal
 * quadrants and later entries go to the first quadrant that fully
 * contains them, or stay at the node when none does. Every entry is
 * stored exactly once.
 */
class QuadTreeIndex
{
public:
    struct Entry {
        uint64_t id = 0;
        cv::Rect2d rect;
    };

    QuadTreeIndex(const cv::Rect2d &bounds, int maxItemsPerNode = 16, int maxDepth = 8);
    ~QuadTreeIndex();

    QuadTreeIndex(QuadTreeIndex&&) noexcept;
    QuadTreeIndex& operator=(QuadTreeIndex&&) noexcept;

    QuadTreeIndex(const QuadTreeIndex&) = delete;
    QuadTreeIndex& operator=(const QuadTreeIndex&) = delete;

    /**
     * @brief Insert an entry
     * @return false if rect does not overlap the root bounds
     */
    bool insert(uint64_t id, const cv::Rect2d &rect);

    /**
     * @brief Replace all content, optionally with new root bounds
     * @return Number of entries accepted
     */
    size_t rebuild(const cv::Rect2d &bounds, const std::vector<Entry> &entries);

    // All entries overlapping range. Order is pre-order over the tree,
    // stable for a fixed insertion order.
    std::vector<Entry> query(const cv::Rect2d &range) const;
    void query(const cv::Rect2d &range, std::vector<Entry> &out) const;

    void clear();
    bool empty() const;

    // Recursive entry count; equals the number of successful inserts
    size_t totalCount() const;
    size_t nodeCount() const;
    int maxDepthReached() const;

    const cv::Rect2d& bounds() const;
    int maxItemsPerNode() const;
    int maxDepth() const;

private:
    struct Node;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
