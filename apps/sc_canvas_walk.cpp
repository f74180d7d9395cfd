#include <cstdint>

#include "sc/core/util/CanvasEngine.hpp"
#include "sc/core/util/EngineConfig.hpp"

#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace po = boost::program_options;

using Engine = CanvasEngine<cv::Mat>;
using Item = Engine::Item;

namespace {

constexpr int kThumbSize = 32;
constexpr int kReportEvery = 30;

cv::Scalar key_color(const std::string &key)
{
    const size_t h = std::hash<std::string>{}(key);
    return cv::Scalar(64 + (h & 0x7f), 64 + ((h >> 8) & 0x7f), 64 + ((h >> 16) & 0x7f));
}

// Stand-in for an expensive widget render: a small thumbnail per item
cv::Mat build_thumbnail(const Item &item)
{
    cv::Mat thumb(kThumbSize, kThumbSize, CV_8UC3, cv::Scalar(30, 30, 30));
    const cv::Scalar color = key_color(item.key);
    if (item.clusterable) {
        cv::circle(thumb, {kThumbSize / 2, kThumbSize / 2}, kThumbSize / 2 - 2, color, cv::FILLED, cv::LINE_AA);
    } else {
        cv::rectangle(thumb, cv::Rect(2, 2, kThumbSize - 4, kThumbSize - 4), color, cv::FILLED);
        cv::rectangle(thumb, cv::Rect(0, 0, kThumbSize, kThumbSize), cv::Scalar(230, 230, 230), 1);
    }
    return thumb;
}

// Markers come in tight groups around a few hot spots, panels are spread
// uniformly. About a quarter of the items are panels.
std::vector<Item> generate_world(size_t count, double extent, uint32_t seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> anywhere(0.0, extent);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::normal_distribution<double> spread(0.0, extent / 100.0);
    std::uniform_int_distribution<int> prio(0, 3);

    std::vector<cv::Point2d> hotspots;
    for (int i = 0; i < 24; i++)
        hotspots.emplace_back(anywhere(rng), anywhere(rng));
    std::uniform_int_distribution<size_t> pick(0, hotspots.size() - 1);

    std::vector<Item> items;
    items.reserve(count);
    for (size_t i = 0; i < count; i++) {
        Item item;
        if (unit(rng) < 0.25) {
            item.key = "panel_" + std::to_string(i);
            const double w = 80 + 220 * unit(rng);
            const double h = 60 + 140 * unit(rng);
            item.rect = cv::Rect2d(anywhere(rng), anywhere(rng), w, h);
            item.clusterable = false;
            item.priority = prio(rng);
        } else {
            item.key = "marker_" + std::to_string(i);
            const cv::Point2d &c = hotspots[pick(rng)];
            const double x = std::clamp(c.x + spread(rng), 0.0, extent);
            const double y = std::clamp(c.y + spread(rng), 0.0, extent);
            item.rect = cv::Rect2d(x, y, 24, 24);
            item.clusterable = true;
        }
        item.build = build_thumbnail;
        items.push_back(std::move(item));
    }
    return items;
}

// Scripted walk: pan right, zoom out, pan down, zoom back in
void step_camera(Engine &engine, int tick, int ticks, const cv::Size2d &viewport)
{
    const int phase = (4 * tick) / std::max(ticks, 1);
    const cv::Point2d center(viewport.width / 2, viewport.height / 2);
    switch (phase) {
    case 0:
        engine.panScreen({-12, 0});
        break;
    case 1:
        engine.zoomAt(0.97, center, viewport);
        break;
    case 2:
        engine.panScreen({0, -12});
        break;
    default:
        engine.zoomAt(1.03, center, viewport);
        break;
    }
}

void composite(const Engine::Frame &frame, cv::Mat &canvas)
{
    const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);
    for (const auto &entry : frame.items) {
        const cv::Rect dst(cvRound(entry.screenRect.x), cvRound(entry.screenRect.y),
                           std::max(1, cvRound(entry.screenRect.width)),
                           std::max(1, cvRound(entry.screenRect.height)));
        const cv::Rect clipped = dst & bounds;
        if (clipped.empty() || entry.artifact->empty())
            continue;

        cv::Mat scaled;
        cv::resize(*entry.artifact, scaled, dst.size(), 0, 0, cv::INTER_LINEAR);
        scaled(cv::Rect(clipped.tl() - dst.tl(), clipped.size())).copyTo(canvas(clipped));

        if (entry.memberCount > 1) {
            cv::putText(canvas, std::to_string(entry.memberCount), clipped.tl() + cv::Point(2, 14),
                        cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
        }
    }
}

void print_metrics(const Engine &engine, const Engine::Frame &frame)
{
    std::cout << std::fixed << std::setprecision(3)
              << "frame " << frame.frameIndex
              << " zoom " << frame.zoom
              << " visible " << frame.visibleCount << "/" << frame.targetCount
              << " total " << frame.totalCount
              << " pending " << frame.pendingCount
              << " built " << frame.builtThisTick
              << " failed " << frame.failedThisTick
              << " batch_ms " << frame.batchDurationMs
              << " hit_ratio " << frame.cacheHitRatio
              << " cached " << engine.cache().size()
              << (frame.complete ? " complete" : "") << std::endl;
}

} // namespace

int main(int argc, char *argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("params,p", po::value<std::string>(), "JSON engine configuration file")
        ("items,n", po::value<size_t>()->default_value(5000), "Number of generated items")
        ("world,w", po::value<double>()->default_value(20000.0), "World extent in world units")
        ("seed,s", po::value<uint32_t>()->default_value(42), "Random seed for the generated world")
        ("ticks,t", po::value<int>()->default_value(240), "Number of simulated frames")
        ("viewport", po::value<std::vector<double>>()->multitoken(), "Viewport size in pixels (W H), defaults to 1280 720")
        ("output,o", po::value<std::string>(), "PNG path for the last frame");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        std::cerr << desc << std::endl;
        return EXIT_FAILURE;
    }

    cv::Size2d viewport(1280, 720);
    if (vm.count("viewport")) {
        const auto dims = vm["viewport"].as<std::vector<double>>();
        if (dims.size() != 2 || !(dims[0] > 0) || !(dims[1] > 0)) {
            std::cerr << "ERROR: --viewport expects two positive values (W H)" << std::endl;
            return EXIT_FAILURE;
        }
        viewport = cv::Size2d(dims[0], dims[1]);
    }

    const size_t itemCount = vm["items"].as<size_t>();
    const double world = vm["world"].as<double>();
    const int ticks = vm["ticks"].as<int>();
    if (!(world > 0) || ticks <= 0) {
        std::cerr << "ERROR: --world and --ticks must be positive" << std::endl;
        return EXIT_FAILURE;
    }

    EngineConfig config;
    try {
        if (vm.count("params"))
            config = load_engine_config(vm["params"].as<std::string>());
        config.validate();
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Engine config: " << engine_config_to_json(config).dump() << std::endl;

    Engine engine(config);
    auto items = generate_world(itemCount, world, vm["seed"].as<uint32_t>());
    const size_t accepted = engine.submitItems(std::move(items));
    std::cout << "Items: " << accepted << ", world extent: " << world << std::endl;

    engine.setViewportSize(viewport);
    // start centered on the world
    engine.setCamera({world / 2 - viewport.width / (2 * config.initialZoom),
                      world / 2 - viewport.height / (2 * config.initialZoom)}, config.initialZoom);

    Engine::Frame frame;
    double totalBatchMs = 0;
    size_t totalBuilt = 0;
    size_t completeFrames = 0;
    for (int t = 0; t < ticks; t++) {
        if (t > 0)
            step_camera(engine, t, ticks, viewport);

        frame = engine.tick(std::chrono::steady_clock::now());
        totalBatchMs += frame.batchDurationMs;
        totalBuilt += frame.builtThisTick;
        completeFrames += frame.complete ? 1 : 0;

        if (t % kReportEvery == 0 || t == ticks - 1)
            print_metrics(engine, frame);
    }

    std::cout << "Built: " << totalBuilt
              << ", complete frames: " << completeFrames << "/" << ticks
              << ", mean batch ms: " << totalBatchMs / ticks
              << ", cache evictions: " << engine.cache().evictions() << std::endl;

    if (vm.count("output")) {
        const std::filesystem::path out = vm["output"].as<std::string>();
        cv::Mat canvas(cvRound(viewport.height), cvRound(viewport.width), CV_8UC3, cv::Scalar(50, 50, 50));
        composite(frame, canvas);
        if (!cv::imwrite(out.string(), canvas)) {
            std::cerr << "ERROR: Could not write " << out.string() << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Saved last frame to " << out.string() << std::endl;
    }

    return EXIT_SUCCESS;
}
