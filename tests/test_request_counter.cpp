#include <catch2/catch_test_macros.hpp>
#include "../src/request_counter.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static std::string temp_state_path(const std::string& name) {
    auto path = fs::temp_directory_path() / ("reqwindow_counter_" + name + ".json");
    fs::remove(path);
    return path.string();
}

TEST_CASE("Request window accounting", "[counter]") {
    std::string path = temp_state_path("accounting");
    SlidingWindowCounter counter(path);

    SECTION("Scenario from a cold start") {
        REQUIRE_FALSE(counter.load());

        for (int i = 0; i < 5; i++) counter.increment();
        counter.rotate();
        REQUIRE(counter.window_total() == 5);

        for (int i = 0; i < 3; i++) counter.increment();
        REQUIRE(counter.window_total() == 8);

        counter.rotate();
        REQUIRE(counter.window_total() == 8);

        for (int i = 0; i < 59; i++) counter.rotate();
        REQUIRE(counter.window_total() == 0);
    }

    SECTION("Rotation writes the open bucket at the cursor") {
        for (int i = 0; i < 3; i++) counter.rotate();
        REQUIRE(counter.snapshot().cursor == 3);

        for (int i = 0; i < 7; i++) counter.increment();
        REQUIRE(counter.pending() == 7);

        counter.rotate();

        auto state = counter.snapshot();
        REQUIRE(state.buckets[3] == 7);
        REQUIRE(state.cursor == 4);
        REQUIRE(state.window_total == 7);
        REQUIRE(counter.pending() == 0);
    }

    SECTION("Total tracks the sum of the last 60 buckets") {
        for (int second = 0; second < 150; second++) {
            for (int i = 0; i < second % 7; i++) counter.increment();
            counter.rotate();

            // Sum of the (second % 7) pattern over the trailing 60 rotations
            uint64_t expected = 0;
            int first = second >= 59 ? second - 59 : 0;
            for (int s = first; s <= second; s++) expected += s % 7;

            auto state = counter.snapshot();
            uint64_t sum = 0;
            for (auto b : state.buckets) sum += b;

            REQUIRE(state.window_total == sum);
            REQUIRE(counter.window_total() == expected);
            REQUIRE(state.cursor == static_cast<std::size_t>((second + 1) % 60));
        }
    }

    SECTION("Idle window decays to zero") {
        for (int i = 0; i < 40; i++) counter.increment();
        counter.rotate();
        for (int i = 0; i < 12; i++) counter.increment();
        counter.rotate();

        for (int i = 0; i < 58; i++) counter.rotate();
        REQUIRE(counter.window_total() == 52);

        counter.rotate();
        REQUIRE(counter.window_total() == 12);

        counter.rotate();
        REQUIRE(counter.window_total() == 0);

        for (int i = 0; i < 100; i++) counter.rotate();
        REQUIRE(counter.window_total() == 0);
    }

    fs::remove(path);
}

TEST_CASE("Concurrent increments are all counted", "[counter]") {
    std::string path = temp_state_path("concurrent");
    SlidingWindowCounter counter(path);

    for (int i = 0; i < 10; i++) counter.increment();
    counter.rotate();
    uint64_t before = counter.window_total();

    constexpr int threads = 8;
    constexpr int per_thread = 5000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&counter]() {
            for (int i = 0; i < per_thread; i++) counter.increment();
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(counter.window_total() == before + threads * per_thread);
    REQUIRE(counter.pending() == static_cast<uint64_t>(threads * per_thread));
}

TEST_CASE("Increments racing rotations are counted exactly once", "[counter]") {
    std::string path = temp_state_path("racing");
    SlidingWindowCounter counter(path);

    constexpr int per_thread = 20000;
    std::thread a([&counter]() { for (int i = 0; i < per_thread; i++) counter.increment(); });
    std::thread b([&counter]() { for (int i = 0; i < per_thread; i++) counter.increment(); });
    std::thread rotator([&counter]() { for (int i = 0; i < 30; i++) counter.rotate(); });

    a.join();
    b.join();
    rotator.join();

    // Fewer than 60 rotations happened, so nothing has been evicted yet.
    REQUIRE(counter.window_total() == static_cast<uint64_t>(2 * per_thread));
}

TEST_CASE("Request window persistence", "[counter][persistence]") {
    std::string path = temp_state_path("persistence");

    SECTION("Flush then load restores the settled window") {
        SlidingWindowCounter before(path);
        for (int second = 0; second < 75; second++) {
            for (int i = 0; i < second % 4; i++) before.increment();
            before.rotate();
        }
        for (int i = 0; i < 9; i++) before.increment();
        before.flush();

        SlidingWindowCounter after(path);
        REQUIRE(after.load());

        auto saved = before.snapshot();
        auto restored = after.snapshot();
        REQUIRE(restored.cursor == saved.cursor);
        REQUIRE(restored.buckets == saved.buckets);
        REQUIRE(restored.window_total == saved.window_total);

        // The open bucket is not persisted.
        REQUIRE(after.pending() == 0);
        REQUIRE(after.window_total() == before.window_total() - 9);
    }

    SECTION("Loading a missing file is a cold start") {
        SlidingWindowCounter counter(path);
        REQUIRE_FALSE(counter.load());

        auto state = counter.snapshot();
        REQUIRE(state.cursor == 0);
        REQUIRE(state.window_total == 0);
        for (auto b : state.buckets) REQUIRE(b == 0);
        REQUIRE(counter.window_total() == 0);
    }

    SECTION("Load discards requests counted before it") {
        SlidingWindowCounter writer(path);
        writer.increment();
        writer.rotate();
        writer.flush();

        SlidingWindowCounter counter(path);
        counter.increment();
        counter.increment();
        REQUIRE(counter.load());
        REQUIRE(counter.pending() == 0);
        REQUIRE(counter.window_total() == 1);
    }

    SECTION("Malformed state file refuses to load") {
        {
            std::ofstream out(path);
            out << "{\"DeltaIdx\": 3, \"Deltas\": [1, 2";
        }

        SlidingWindowCounter counter(path);
        REQUIRE_THROWS_AS(counter.load(), StateCorruptionError);
    }

    SECTION("Un-wrapped cursor on disk resumes at slot zero") {
        nlohmann::json doc = {
            {"DeltaIdx", 60},
            {"Deltas", std::vector<uint64_t>(WINDOW_BUCKETS, 1)},
            {"TimeWindowReqNo", 60}
        };
        {
            std::ofstream out(path);
            out << doc.dump();
        }

        SlidingWindowCounter counter(path);
        REQUIRE(counter.load());
        REQUIRE(counter.snapshot().cursor == 0);

        for (int i = 0; i < 5; i++) counter.increment();
        counter.rotate();

        auto state = counter.snapshot();
        REQUIRE(state.buckets[0] == 5);
        REQUIRE(state.cursor == 1);
        REQUIRE(counter.window_total() == 64);
    }

    fs::remove(path);
}
