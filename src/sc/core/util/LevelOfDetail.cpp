#include "sc/core/util/LevelOfDetail.hpp"
#include "sc/core/util/Geometry.hpp"

#include <cmath>
#include <stdexcept>

LevelOfDetailReducer::LevelOfDetailReducer(const LodParams &params) : _params(params)
{
    if (!(params.clusterPixelThreshold >= 0) || !std::isfinite(params.clusterPixelThreshold))
        throw std::invalid_argument("LevelOfDetailReducer: clusterPixelThreshold must be finite and non-negative");
    if (params.clusterSizeCutoff < 1 || params.veryLowZoomClusterCutoff < 1)
        throw std::invalid_argument("LevelOfDetailReducer: cluster cutoffs must be at least 1");
}

bool LevelOfDetailReducer::applies(size_t candidateCount, double zoom) const
{
    return _params.enabled && zoom > 0 && zoom < _params.zoomThreshold &&
           candidateCount >= _params.minCandidates;
}

int LevelOfDetailReducer::cutoffForZoom(double zoom) const
{
    return zoom < _params.veryLowZoom ? _params.veryLowZoomClusterCutoff : _params.clusterSizeCutoff;
}

LodResult LevelOfDetailReducer::reduce(const std::vector<LodCandidate> &candidates, double zoom) const
{
    LodResult result;
    if (!applies(candidates.size(), zoom)) {
        result.items = candidates;
        return result;
    }

    std::vector<const LodCandidate*> clusterable;
    std::vector<const LodCandidate*> fixed;
    for (const auto &c : candidates) {
        if (c.clusterable)
            clusterable.push_back(&c);
        else
            fixed.push_back(&c);
    }

    const double worldThreshold = _params.clusterPixelThreshold / zoom;
    const size_t cutoff = static_cast<size_t>(cutoffForZoom(zoom));

    result.items.reserve(candidates.size());
    std::vector<bool> processed(clusterable.size(), false);
    std::vector<size_t> members;

    for (size_t i = 0; i < clusterable.size(); i++) {
        if (processed[i])
            continue;

        members.clear();
        members.push_back(i);
        processed[i] = true;
        const cv::Point2d seed = rect_center(clusterable[i]->rect);

        for (size_t j = i + 1; j < clusterable.size(); j++) {
            if (processed[j])
                continue;
            if (point_distance(seed, rect_center(clusterable[j]->rect)) < worldThreshold) {
                members.push_back(j);
                processed[j] = true;
            }
        }

        if (members.size() > cutoff) {
            LodCandidate rep = *clusterable[i];
            rep.memberCount = members.size();
            result.items.push_back(rep);
            result.clustersCollapsed++;
            result.itemsHidden += members.size() - 1;
        } else {
            for (size_t m : members)
                result.items.push_back(*clusterable[m]);
        }
    }

    for (const auto *c : fixed)
        result.items.push_back(*c);

    return result;
}
