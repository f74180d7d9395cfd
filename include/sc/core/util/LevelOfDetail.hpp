#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

// Parameters for level-of-detail clustering
struct LodParams {
    bool enabled = true;
    // clustering only runs below this zoom
    double zoomThreshold = 0.5;
    // smaller candidate sets are never reduced
    size_t minCandidates = 100;
    // grouping radius in screen pixels, divided by zoom for world space
    double clusterPixelThreshold = 50.0;
    // clusters larger than the cutoff collapse to one representative
    int clusterSizeCutoff = 5;
    // below veryLowZoom the stricter cutoff applies
    double veryLowZoom = 0.3;
    int veryLowZoomClusterCutoff = 3;
};

struct LodCandidate {
    uint64_t id = 0;
    cv::Rect2d rect;
    bool clusterable = false;
    // 1 for an individual item, cluster size for a representative
    size_t memberCount = 1;
};

struct LodResult {
    std::vector<LodCandidate> items;
    size_t clustersCollapsed = 0;
    size_t itemsHidden = 0;
};

// Collapses dense groups of clusterable items at low zoom.
//
// Greedy seed clustering: each unprocessed clusterable item seeds a
// cluster that absorbs every later unprocessed item whose center lies
// closer than clusterPixelThreshold / zoom to the seed's center.
// This is O(n^2) over the clusterable candidates; it only ever sees the
// culled visible set, never the whole world.
class LevelOfDetailReducer
{
public:
    explicit LevelOfDetailReducer(const LodParams &params = {});

    const LodParams& params() const { return _params; }

    // true if reduce() would cluster a set of this size at this zoom
    bool applies(size_t candidateCount, double zoom) const;
    int cutoffForZoom(double zoom) const;

    // Output: reduced clusterable items in seed order, then the
    // non-clusterable ones in input order
    LodResult reduce(const std::vector<LodCandidate> &candidates, double zoom) const;

private:
    LodParams _params;
};
