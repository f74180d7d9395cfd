#include <catch2/catch.hpp>

#include "sc/core/util/BuildScheduler.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;
using Item = CanvasItem<std::string>;
using ItemPtr = CanvasItemPtr<std::string>;

struct FakeClock {
    Clock::time_point now{};
    void advance(double ms)
    {
        now += std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double, std::milli>(ms));
    }
};

struct BuildLog {
    std::map<std::string, int> calls;
};

ItemPtr make_item(const std::string& key, std::shared_ptr<BuildLog> log, FakeClock* clock = nullptr,
                  double costMs = 0.0)
{
    auto item = std::make_shared<Item>();
    item->key = key;
    item->rect = cv::Rect2d(0, 0, 10, 10);
    item->build = [log, clock, costMs](const Item& self) {
        log->calls[self.key]++;
        if (clock) {
            clock->advance(costMs);
        }
        return "artifact:" + self.key;
    };
    return item;
}

std::vector<ItemPtr> make_items(size_t n, std::shared_ptr<BuildLog> log, FakeClock* clock = nullptr,
                                double costMs = 0.0)
{
    std::vector<ItemPtr> items;
    for (size_t i = 0; i < n; i++) {
        items.push_back(make_item("item-" + std::to_string(i), log, clock, costMs));
    }
    return items;
}

} // namespace

TEST_CASE("Builds are spread over ticks by the per-tick limit")
{
    ResultCache<std::string> cache(100);
    FakeClock clock;
    BuildScheduler<std::string> scheduler(cache, {10, 16.0});
    scheduler.setTimeSource([&clock] { return clock.now; });

    auto log = std::make_shared<BuildLog>();
    scheduler.setTarget(make_items(25, log));
    REQUIRE(scheduler.state() == SchedulerState::Building);

    auto first = scheduler.tick(clock.now);
    REQUIRE(first.built == 10);
    REQUIRE_FALSE(first.completed);
    REQUIRE(scheduler.cursor() == 10);

    auto second = scheduler.tick(clock.now);
    REQUIRE(second.built == 10);
    REQUIRE(scheduler.cursor() == 20);

    auto third = scheduler.tick(clock.now);
    REQUIRE(third.built == 5);
    REQUIRE(third.completed);
    REQUIRE(scheduler.cursor() == 25);
    REQUIRE(scheduler.state() == SchedulerState::Idle);
    REQUIRE(scheduler.readyCount() == 25);
    REQUIRE(scheduler.pendingCount() == 0);
    REQUIRE(cache.size() == 25);
}

TEST_CASE("Tick stops once the batch budget is spent")
{
    ResultCache<std::string> cache(100);
    FakeClock clock;
    BuildScheduler<std::string> scheduler(cache, {15, 16.0});
    scheduler.setTimeSource([&clock] { return clock.now; });

    auto log = std::make_shared<BuildLog>();
    scheduler.setTarget(make_items(10, log, &clock, 6.0));

    // 6ms per build: 6, 12, then 18 > 16 stops the batch
    auto batch = scheduler.tick(clock.now);
    REQUIRE(batch.processed == 3);
    REQUIRE(batch.built == 3);
    REQUIRE(batch.durationMs == Approx(18.0));
    REQUIRE(scheduler.cursor() == 3);
}

TEST_CASE("The budget counts from the start of the batch, not the frame")
{
    ResultCache<std::string> cache(100);
    FakeClock clock;
    clock.advance(1000.0);
    BuildScheduler<std::string> scheduler(cache);
    scheduler.setTimeSource([&clock] { return clock.now; });

    auto log = std::make_shared<BuildLog>();
    scheduler.setTarget(make_items(5, log));

    // the frame began 20ms ago, more than the whole budget
    const auto frameStart = clock.now - std::chrono::milliseconds(20);
    auto batch = scheduler.tick(frameStart);
    REQUIRE(batch.processed == 5);
    REQUIRE(batch.completed);
    REQUIRE(batch.startDelayMs == Approx(20.0));
}

TEST_CASE("A build slower than the budget still makes progress")
{
    ResultCache<std::string> cache(100);
    FakeClock clock;
    BuildScheduler<std::string> scheduler(cache);
    scheduler.setTimeSource([&clock] { return clock.now; });

    auto log = std::make_shared<BuildLog>();
    scheduler.setTarget(make_items(5, log, &clock, 40.0));

    auto batch = scheduler.tick(clock.now);
    REQUIRE(batch.processed == 1);
    REQUIRE(batch.built == 1);
    REQUIRE(scheduler.cursor() == 1);

    batch = scheduler.tick(clock.now);
    REQUIRE(batch.processed == 1);
    REQUIRE(scheduler.cursor() == 2);
}

TEST_CASE("Ready items carry over to the next target without rebuilding")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    auto x = make_item("X", log);
    auto y = make_item("Y", log);
    auto z = make_item("Z", log);

    scheduler.setTarget({x, y});
    scheduler.tick(Clock::now());
    REQUIRE(scheduler.state() == SchedulerState::Idle);

    scheduler.setTarget({z, x});
    REQUIRE_FALSE(scheduler.isCarried(0));
    REQUIRE(scheduler.isCarried(1));
    REQUIRE(scheduler.isReady(1));

    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.built == 1);
    REQUIRE(batch.completed);
    REQUIRE(log->calls["X"] == 1);
    REQUIRE(log->calls["Z"] == 1);
}

TEST_CASE("An item with the same key but a new object is not carried")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    scheduler.setTarget({make_item("X", log)});
    scheduler.tick(Clock::now());

    scheduler.setTarget({make_item("X", log)});
    REQUIRE_FALSE(scheduler.isCarried(0));

    // the cached artifact is still found by key
    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.reused == 1);
    REQUIRE(batch.built == 0);
    REQUIRE(log->calls["X"] == 1);
}

TEST_CASE("Retargeting mid-build restarts at the new list and keeps the cache")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache, {4, 16.0});
    auto log = std::make_shared<BuildLog>();

    auto items = make_items(10, log);
    scheduler.setTarget(items);
    scheduler.tick(Clock::now());
    REQUIRE(scheduler.cursor() == 4);
    REQUIRE(cache.size() == 4);

    std::vector<ItemPtr> next(items.begin() + 2, items.begin() + 6);
    scheduler.setTarget(next);
    REQUIRE(scheduler.cursor() == 0);
    REQUIRE(scheduler.building());
    REQUIRE(cache.size() == 4);

    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.processed == 4);
    REQUIRE(batch.built == 2);
    REQUIRE(batch.completed);
    for (const auto& item : items) {
        REQUIRE(log->calls[item->key] <= 1);
    }
}

TEST_CASE("A failing build is skipped and retried on the following ticks")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    int failuresLeft = 2;
    auto bad = std::make_shared<Item>();
    bad->key = "bad";
    bad->rect = cv::Rect2d(0, 0, 1, 1);
    bad->build = [&failuresLeft, log](const Item& self) -> std::string {
        log->calls[self.key]++;
        if (failuresLeft > 0) {
            failuresLeft--;
            throw std::runtime_error("decoder unavailable");
        }
        return "ok";
    };
    ItemPtr badPtr = bad;
    auto good = make_item("good", log);

    scheduler.setTarget({badPtr, good});
    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.failed == 1);
    REQUIRE(batch.built == 1);
    REQUIRE_FALSE(batch.completed);
    REQUIRE(scheduler.building());
    REQUIRE(scheduler.failedCount() == 1);
    REQUIRE(scheduler.pendingCount() == 1);
    REQUIRE_FALSE(scheduler.isReady(0));
    REQUIRE(scheduler.isReady(1));
    REQUIRE_FALSE(cache.contains("bad"));

    // same target, no setTarget in between
    batch = scheduler.tick(Clock::now());
    REQUIRE(batch.processed == 1);
    REQUIRE(batch.failed == 1);
    REQUIRE_FALSE(batch.completed);

    batch = scheduler.tick(Clock::now());
    REQUIRE(batch.built == 1);
    REQUIRE(batch.failed == 0);
    REQUIRE(batch.completed);
    REQUIRE(scheduler.state() == SchedulerState::Idle);
    REQUIRE(scheduler.failedCount() == 0);
    REQUIRE(cache.contains("bad"));
    REQUIRE(log->calls["bad"] == 3);
    REQUIRE(log->calls["good"] == 1);
}

TEST_CASE("A build throwing a non-standard exception is contained")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    auto odd = std::make_shared<Item>();
    odd->key = "odd";
    odd->rect = cv::Rect2d(0, 0, 1, 1);
    odd->build = [](const Item&) -> std::string { throw 42; };

    scheduler.setTarget({odd, make_item("after", log)});
    BatchResult batch;
    REQUIRE_NOTHROW(batch = scheduler.tick(Clock::now()));
    REQUIRE(batch.failed == 1);
    REQUIRE(batch.built == 1);
    REQUIRE(scheduler.cursor() == 2);
    REQUIRE(cache.contains("after"));

    REQUIRE_NOTHROW(batch = scheduler.tick(Clock::now()));
    REQUIRE(batch.failed == 1);
}

TEST_CASE("A new target drops pending retries")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    auto broken = std::make_shared<Item>();
    broken->key = "broken";
    broken->rect = cv::Rect2d(0, 0, 1, 1);
    broken->build = [](const Item&) -> std::string { throw std::runtime_error("always"); };

    scheduler.setTarget({broken});
    scheduler.tick(Clock::now());
    REQUIRE(scheduler.failedCount() == 1);

    auto other = make_item("other", log);
    scheduler.setTarget({other});
    REQUIRE(scheduler.failedCount() == 0);
    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.completed);
    REQUIRE(scheduler.state() == SchedulerState::Idle);
}

TEST_CASE("A carried item evicted from the cache is rebuilt")
{
    ResultCache<std::string> cache(100);
    BuildScheduler<std::string> scheduler(cache);
    auto log = std::make_shared<BuildLog>();

    auto x = make_item("X", log);
    scheduler.setTarget({x});
    scheduler.tick(Clock::now());

    cache.erase("X");
    scheduler.setTarget({x});
    REQUIRE(scheduler.isCarried(0));

    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.built == 1);
    REQUIRE(log->calls["X"] == 2);
    REQUIRE(scheduler.isReady(0));
}

TEST_CASE("Idle scheduler ticks do nothing")
{
    ResultCache<std::string> cache(10);
    BuildScheduler<std::string> scheduler(cache);
    REQUIRE(scheduler.state() == SchedulerState::Idle);

    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.processed == 0);
    REQUIRE_FALSE(batch.completed);

    auto log = std::make_shared<BuildLog>();
    scheduler.setTarget(make_items(2, log));
    scheduler.tick(Clock::now());
    scheduler.reset();
    REQUIRE(scheduler.target().empty());
    REQUIRE(scheduler.state() == SchedulerState::Idle);
}

TEST_CASE("An empty target completes on the first tick")
{
    ResultCache<std::string> cache(10);
    BuildScheduler<std::string> scheduler(cache);
    scheduler.setTarget({});
    auto batch = scheduler.tick(Clock::now());
    REQUIRE(batch.processed == 0);
    REQUIRE(batch.completed);
    REQUIRE(scheduler.state() == SchedulerState::Idle);
}

TEST_CASE("Invalid scheduler parameters are rejected")
{
    ResultCache<std::string> cache(10);
    REQUIRE_THROWS_AS(BuildScheduler<std::string>(cache, {0, 16.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(BuildScheduler<std::string>(cache, {5, 0.0}), std::invalid_argument);
}
