#include "sc/core/util/EngineConfig.hpp"
#include "sc/core/util/LoadJson.hpp"

#include <cmath>
#include <stdexcept>

namespace {

void require(bool ok, const char* field, const std::string& what)
{
    if (!ok) {
        throw std::invalid_argument(std::string("EngineConfig: ") + field + " " + what);
    }
}

bool positive(double v)
{
    return std::isfinite(v) && v > 0;
}

} // anonymous namespace

void EngineConfig::validate() const
{
    require(positive(minZoom), "min_zoom", "must be finite and positive");
    require(positive(maxZoom), "max_zoom", "must be finite and positive");
    require(minZoom <= maxZoom, "min_zoom", "must not exceed max_zoom");
    require(positive(initialZoom), "initial_zoom", "must be finite and positive");
    require(positive(minScreenExtent), "min_screen_extent", "must be finite and positive");

    require(maxItemsPerNode > 0, "max_items_per_node", "must be positive");
    require(maxDepth >= 0, "max_depth", "must not be negative");
    require(std::isfinite(indexMargin) && indexMargin >= 0, "index_margin", "must be finite and non-negative");

    require(positive(lodZoomThreshold), "lod_zoom_threshold", "must be finite and positive");
    require(std::isfinite(clusterPixelThreshold) && clusterPixelThreshold >= 0,
            "cluster_pixel_threshold", "must be finite and non-negative");
    require(clusterSizeCutoff >= 1, "cluster_size_cutoff", "must be at least 1");
    require(std::isfinite(veryLowZoom) && veryLowZoom >= 0, "very_low_zoom", "must be finite and non-negative");
    require(veryLowZoomClusterCutoff >= 1, "very_low_zoom_cluster_cutoff", "must be at least 1");

    require(cacheCapacity > 0, "cache_capacity", "must be positive");
    require(maxBuildsPerTick > 0, "max_builds_per_tick", "must be positive");
    require(positive(tickBudgetMs), "tick_budget_ms", "must be finite and positive");
}

LodParams EngineConfig::lodParams() const
{
    LodParams p;
    p.enabled = enableClustering;
    p.zoomThreshold = lodZoomThreshold;
    p.minCandidates = lodMinCandidates;
    p.clusterPixelThreshold = clusterPixelThreshold;
    p.clusterSizeCutoff = clusterSizeCutoff;
    p.veryLowZoom = veryLowZoom;
    p.veryLowZoomClusterCutoff = veryLowZoomClusterCutoff;
    return p;
}

SchedulerParams EngineConfig::schedulerParams() const
{
    return {maxBuildsPerTick, tickBudgetMs};
}

EngineConfig engine_config_from_json(const nlohmann::json& json, const std::string& context)
{
    using namespace sc::json;
    require_object(json, context);

    EngineConfig c;
    c.minZoom = number_or(json, "min_zoom", c.minZoom, context);
    c.maxZoom = number_or(json, "max_zoom", c.maxZoom, context);
    c.initialZoom = number_or(json, "initial_zoom", c.initialZoom, context);
    c.minScreenExtent = number_or(json, "min_screen_extent", c.minScreenExtent, context);

    c.maxItemsPerNode = int_or(json, "max_items_per_node", c.maxItemsPerNode, context);
    c.maxDepth = int_or(json, "max_depth", c.maxDepth, context);
    c.indexMargin = number_or(json, "index_margin", c.indexMargin, context);

    c.enableClustering = bool_or(json, "enable_clustering", c.enableClustering, context);
    c.lodZoomThreshold = number_or(json, "lod_zoom_threshold", c.lodZoomThreshold, context);
    const int64_t minCandidates = integer_or(json, "lod_min_candidates", static_cast<int64_t>(c.lodMinCandidates), context);
    if (minCandidates < 0) {
        throw std::runtime_error(context + " field 'lod_min_candidates' must not be negative");
    }
    c.lodMinCandidates = static_cast<size_t>(minCandidates);
    c.clusterPixelThreshold = number_or(json, "cluster_pixel_threshold", c.clusterPixelThreshold, context);
    c.clusterSizeCutoff = int_or(json, "cluster_size_cutoff", c.clusterSizeCutoff, context);
    c.veryLowZoom = number_or(json, "very_low_zoom", c.veryLowZoom, context);
    c.veryLowZoomClusterCutoff = int_or(json, "very_low_zoom_cluster_cutoff", c.veryLowZoomClusterCutoff, context);

    const int64_t capacity = integer_or(json, "cache_capacity", static_cast<int64_t>(c.cacheCapacity), context);
    if (capacity < 0) {
        throw std::runtime_error(context + " field 'cache_capacity' must not be negative");
    }
    c.cacheCapacity = static_cast<size_t>(capacity);
    c.maxBuildsPerTick = int_or(json, "max_builds_per_tick", c.maxBuildsPerTick, context);
    c.tickBudgetMs = number_or(json, "tick_budget_ms", c.tickBudgetMs, context);
    return c;
}

EngineConfig load_engine_config(const std::filesystem::path& path)
{
    return engine_config_from_json(sc::json::load_json_file(path), path.string());
}

nlohmann::json engine_config_to_json(const EngineConfig& c)
{
    return {
        {"min_zoom", c.minZoom},
        {"max_zoom", c.maxZoom},
        {"initial_zoom", c.initialZoom},
        {"min_screen_extent", c.minScreenExtent},
        {"max_items_per_node", c.maxItemsPerNode},
        {"max_depth", c.maxDepth},
        {"index_margin", c.indexMargin},
        {"enable_clustering", c.enableClustering},
        {"lod_zoom_threshold", c.lodZoomThreshold},
        {"lod_min_candidates", c.lodMinCandidates},
        {"cluster_pixel_threshold", c.clusterPixelThreshold},
        {"cluster_size_cutoff", c.clusterSizeCutoff},
        {"very_low_zoom", c.veryLowZoom},
        {"very_low_zoom_cluster_cutoff", c.veryLowZoomClusterCutoff},
        {"cache_capacity", c.cacheCapacity},
        {"max_builds_per_tick", c.maxBuildsPerTick},
        {"tick_budget_ms", c.tickBudgetMs},
    };
}
