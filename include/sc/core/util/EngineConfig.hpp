#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "sc/core/util/BuildScheduler.hpp"
#include "sc/core/util/LevelOfDetail.hpp"

// Tuning for CanvasEngine. Defaults match a 60 fps canvas of a few
// thousand items.
struct EngineConfig {
    // Camera
    double minZoom = 0.1;
    double maxZoom = 10.0;
    double initialZoom = 1.0;
    // screen rects never get smaller than this many pixels
    double minScreenExtent = 1.0;

    // Spatial index
    int maxItemsPerNode = 16;
    int maxDepth = 8;
    // world units added around the item bounds when the index is rebuilt
    double indexMargin = 100.0;

    // Level of detail
    bool enableClustering = true;
    double lodZoomThreshold = 0.5;
    size_t lodMinCandidates = 100;
    double clusterPixelThreshold = 50.0;
    int clusterSizeCutoff = 5;
    double veryLowZoom = 0.3;
    int veryLowZoomClusterCutoff = 3;

    // Result cache
    size_t cacheCapacity = 1000;

    // Build scheduler
    int maxBuildsPerTick = 15;
    double tickBudgetMs = 16.0;

    // throws std::invalid_argument naming the first bad field
    void validate() const;

    LodParams lodParams() const;
    SchedulerParams schedulerParams() const;
};

EngineConfig engine_config_from_json(const nlohmann::json& json, const std::string& context = "engine config");
EngineConfig load_engine_config(const std::filesystem::path& path);
nlohmann::json engine_config_to_json(const EngineConfig& config);
