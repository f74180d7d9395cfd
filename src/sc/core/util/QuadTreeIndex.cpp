#include "sc/core/util/QuadTreeIndex.hpp"
#include "sc/core/util/Geometry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

struct QuadTreeIndex::Node {
    cv::Rect2d bounds;
    int depth = 0;
    std::vector<Entry> items;
    // either empty or all four set: NW, NE, SW, SE
    std::array<std::unique_ptr<Node>, 4> children;

    Node(const cv::Rect2d &b, int d) : bounds(b), depth(d) {}

    bool divided() const { return children[0] != nullptr; }

    void subdivide()
    {
        const double x = bounds.x;
        const double y = bounds.y;
        const double w = bounds.width / 2;
        const double h = bounds.height / 2;

        children[0] = std::make_unique<Node>(cv::Rect2d(x, y, w, h), depth + 1);
        children[1] = std::make_unique<Node>(cv::Rect2d(x + w, y, w, h), depth + 1);
        children[2] = std::make_unique<Node>(cv::Rect2d(x, y + h, w, h), depth + 1);
        children[3] = std::make_unique<Node>(cv::Rect2d(x + w, y + h, w, h), depth + 1);
    }

    // caller has checked overlap with this node
    void insert(const Entry &e, int maxItems, int maxDepth)
    {
        if (static_cast<int>(items.size()) < maxItems || depth >= maxDepth) {
            items.push_back(e);
            return;
        }

        if (!divided())
            subdivide();

        for (auto &child : children) {
            if (rect_contains(child->bounds, e.rect)) {
                child->insert(e, maxItems, maxDepth);
                return;
            }
        }

        // straddles a split line, keep it here
        items.push_back(e);
    }

    void query(const cv::Rect2d &range, std::vector<Entry> &out) const
    {
        // root entries may stick out of the root bounds, so the root is never pruned
        if (depth > 0 && !rect_overlaps(bounds, range))
            return;

        for (const auto &e : items)
            if (rect_overlaps(e.rect, range))
                out.push_back(e);

        if (divided())
            for (const auto &child : children)
                child->query(range, out);
    }

    size_t count() const
    {
        size_t n = items.size();
        if (divided())
            for (const auto &child : children)
                n += child->count();
        return n;
    }

    size_t nodes() const
    {
        size_t n = 1;
        if (divided())
            for (const auto &child : children)
                n += child->nodes();
        return n;
    }

    int deepest() const
    {
        int d = depth;
        if (divided())
            for (const auto &child : children)
                d = std::max(d, child->deepest());
        return d;
    }
};

struct QuadTreeIndex::Impl {
    std::unique_ptr<Node> root;
    int maxItemsPerNode = 16;
    int maxDepth = 8;

    static void validateBounds(const cv::Rect2d &bounds)
    {
        if (!rect_valid(bounds) || bounds.width <= 0 || bounds.height <= 0)
            throw std::invalid_argument("QuadTreeIndex: root bounds must be finite and non-empty");
    }
};

QuadTreeIndex::QuadTreeIndex(const cv::Rect2d &bounds, int maxItemsPerNode, int maxDepth)
    : impl_(std::make_unique<Impl>())
{
    if (maxItemsPerNode <= 0)
        throw std::invalid_argument("QuadTreeIndex: maxItemsPerNode must be positive, got " + std::to_string(maxItemsPerNode));
    if (maxDepth < 0)
        throw std::invalid_argument("QuadTreeIndex: maxDepth must not be negative, got " + std::to_string(maxDepth));
    Impl::validateBounds(bounds);

    impl_->maxItemsPerNode = maxItemsPerNode;
    impl_->maxDepth = maxDepth;
    impl_->root = std::make_unique<Node>(bounds, 0);
}

QuadTreeIndex::~QuadTreeIndex() = default;

QuadTreeIndex::QuadTreeIndex(QuadTreeIndex&&) noexcept = default;
QuadTreeIndex& QuadTreeIndex::operator=(QuadTreeIndex&&) noexcept = default;

bool QuadTreeIndex::insert(uint64_t id, const cv::Rect2d &rect)
{
    if (!rect_overlaps(impl_->root->bounds, rect))
        return false;

    impl_->root->insert({id, rect}, impl_->maxItemsPerNode, impl_->maxDepth);
    return true;
}

size_t QuadTreeIndex::rebuild(const cv::Rect2d &bounds, const std::vector<Entry> &entries)
{
    Impl::validateBounds(bounds);
    impl_->root = std::make_unique<Node>(bounds, 0);

    size_t accepted = 0;
    for (const auto &e : entries)
        if (insert(e.id, e.rect))
            accepted++;
    return accepted;
}

std::vector<QuadTreeIndex::Entry> QuadTreeIndex::query(const cv::Rect2d &range) const
{
    std::vector<Entry> out;
    query(range, out);
    return out;
}

void QuadTreeIndex::query(const cv::Rect2d &range, std::vector<Entry> &out) const
{
    if (!rect_valid(range))
        return;
    impl_->root->query(range, out);
}

void QuadTreeIndex::clear()
{
    impl_->root = std::make_unique<Node>(impl_->root->bounds, 0);
}

bool QuadTreeIndex::empty() const
{
    return totalCount() == 0;
}

size_t QuadTreeIndex::totalCount() const
{
    return impl_->root->count();
}

size_t QuadTreeIndex::nodeCount() const
{
    return impl_->root->nodes();
}

int QuadTreeIndex::maxDepthReached() const
{
    return impl_->root->deepest();
}

const cv::Rect2d& QuadTreeIndex::bounds() const
{
    return impl_->root->bounds;
}

int QuadTreeIndex::maxItemsPerNode() const
{
    return impl_->maxItemsPerNode;
}

int QuadTreeIndex::maxDepth() const
{
    return impl_->maxDepth;
}
