// tests/test_event_queue.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentflow/core/errors.h"
#include "agentflow/queue/event_queue.h"
#include "test_helpers.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace agentflow;
using namespace std::chrono_literals;
using agentflow::testing::make_event;

namespace {

struct RunRecord {
    std::string event_id;
    std::string key;
    std::chrono::steady_clock::time_point start;
    std::chrono::steady_clock::time_point end;
};

// 记录每次运行的起止时间
class Recorder {
public:
    EventQueue::RunFunction run_function(std::chrono::milliseconds work) {
        return [this, work](const Event& event) {
            RunRecord record{event.id, conversation_key(event), std::chrono::steady_clock::now(), {}};
            std::this_thread::sleep_for(work);
            record.end = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(record);
        };
    }

    std::vector<RunRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<RunRecord> records_;
};

} // namespace

TEST_CASE("Events sharing a conversation key never run concurrently", "[queue]") {
    Recorder recorder;
    EventQueue::Config config;
    config.worker_count = 4;
    EventQueue queue(config, recorder.run_function(10ms));
    queue.start();

    for (int i = 0; i < 6; ++i) {
        queue.submit(make_event("a" + std::to_string(i), "x", std::string("alice")));
        queue.submit(make_event("b" + std::to_string(i), "x", std::string("bob")));
    }
    queue.wait_idle();

    auto records = recorder.records();
    REQUIRE(records.size() == 12);

    std::map<std::string, std::vector<RunRecord>> by_key;
    for (const auto& r : records) {
        by_key[r.key].push_back(r);
    }
    REQUIRE(by_key.size() == 2);

    for (auto& [key, runs] : by_key) {
        std::sort(runs.begin(), runs.end(),
                  [](const RunRecord& l, const RunRecord& r) { return l.start < r.start; });
        for (size_t i = 1; i < runs.size(); ++i) {
            REQUIRE(runs[i - 1].end <= runs[i].start);
        }
        // 按提交顺序执行
        const char prefix = key.front() == 'a' ? 'a' : 'b';
        for (size_t i = 0; i < runs.size(); ++i) {
            REQUIRE(runs[i].event_id == std::string(1, prefix) + std::to_string(i));
        }
    }
}

TEST_CASE("Distinct conversation keys run in parallel", "[queue]") {
    std::mutex mutex;
    std::condition_variable cv;
    int running = 0;
    int started = 0;
    int peak = 0;

    EventQueue::Config config;
    config.worker_count = 2;
    EventQueue queue(config, [&](const Event&) {
        std::unique_lock<std::mutex> lock(mutex);
        ++running;
        ++started;
        peak = std::max(peak, running);
        cv.notify_all();
        // 等另一个运行开始，超时则放弃
        cv.wait_for(lock, 2s, [&]() { return started >= 2; });
        --running;
    });
    queue.start();

    queue.submit(make_event("e1", "x", std::string("alice")));
    queue.submit(make_event("e2", "x", std::string("bob")));
    queue.wait_idle();

    REQUIRE(peak == 2);
}

TEST_CASE("Events submitted before start are held", "[queue]") {
    std::atomic<int> runs{0};
    EventQueue queue({}, [&](const Event&) { ++runs; });

    queue.submit(make_event("e1"));
    queue.submit(make_event("e2"));
    std::this_thread::sleep_for(20ms);
    REQUIRE(runs == 0);
    REQUIRE(queue.pending() == 2);
    REQUIRE_FALSE(queue.running());

    queue.start();
    queue.wait_idle();
    REQUIRE(runs == 2);
    REQUIRE(queue.pending() == 0);
    REQUIRE(queue.in_flight() == 0);
}

TEST_CASE("Invalid events are rejected at submit", "[queue]") {
    EventQueue queue({}, [](const Event&) {});
    auto event = make_event("e1");
    event.action.clear();
    REQUIRE_THROWS_AS(queue.submit(event), InvalidEvent);
    REQUIRE(queue.pending() == 0);
}

TEST_CASE("Shutdown drains pending events and closes admission", "[queue]") {
    std::atomic<int> runs{0};
    EventQueue::Config config;
    config.worker_count = 1;
    EventQueue queue(config, [&](const Event&) {
        std::this_thread::sleep_for(5ms);
        ++runs;
    });
    queue.start();
    for (int i = 0; i < 5; ++i) {
        queue.submit(make_event("e" + std::to_string(i), "x", std::string("alice")));
    }
    queue.shutdown();

    REQUIRE(runs == 5);
    REQUIRE_FALSE(queue.running());
    REQUIRE_THROWS_AS(queue.submit(make_event("late")), QueueClosed);
    REQUIRE_NOTHROW(queue.shutdown());
}

TEST_CASE("A run that throws does not stop the worker", "[queue]") {
    std::atomic<int> runs{0};
    EventQueue::Config config;
    config.worker_count = 1;
    EventQueue queue(config, [&](const Event& event) {
        ++runs;
        if (event.id == "bad") {
            throw std::runtime_error("boom");
        }
    });
    queue.start();
    queue.submit(make_event("bad", "x", std::string("alice")));
    queue.submit(make_event("good", "x", std::string("alice")));
    queue.wait_idle();
    REQUIRE(runs == 2);
}

TEST_CASE("A run throwing a non-std exception does not stop the worker", "[queue]") {
    std::atomic<int> runs{0};
    EventQueue::Config config;
    config.worker_count = 1;
    EventQueue queue(config, [&](const Event& event) {
        ++runs;
        if (event.id == "bad") {
            throw 42;
        }
    });
    queue.start();
    queue.submit(make_event("bad", "x", std::string("alice")));
    queue.submit(make_event("good", "x", std::string("bob")));
    queue.wait_idle();
    REQUIRE(runs == 2);
    REQUIRE(queue.running());
}

TEST_CASE("wait_idle returns before start even with pending events", "[queue]") {
    std::atomic<int> runs{0};
    EventQueue queue({}, [&](const Event&) { ++runs; });
    queue.submit(make_event("e1"));

    queue.wait_idle();
    REQUIRE(queue.pending() == 1);
    REQUIRE(runs == 0);

    queue.start();
    queue.wait_idle();
    REQUIRE(runs == 1);
}
