#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <mutex>
#include <set>

struct KeyState {
    std::mutex mutex;
    long counter = 0;
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, KeyState> map;
};

// Базовые тесты
TEST_F(ThreadSafeMapTest, InsertAndFind) {
    auto state = std::make_shared<KeyState>();
    state->counter = 42;
    map.insert("P1/L1", state);

    auto found = map.find("P1/L1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->counter, 42);
    EXPECT_EQ(map.find("P1/L2"), nullptr);
}

TEST_F(ThreadSafeMapTest, Contains) {
    map.getOrCreate("P1/L1");

    EXPECT_TRUE(map.contains("P1/L1"));
    EXPECT_FALSE(map.contains("P2/L1"));
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, GetOrCreate_ReturnsExisting) {
    auto first = map.getOrCreate("P1/L1");
    first->counter = 7;

    auto second = map.getOrCreate("P1/L1");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(second->counter, 7);
}

TEST_F(ThreadSafeMapTest, Values_SnapshotOfAll) {
    map.getOrCreate("a");
    map.getOrCreate("b");
    map.getOrCreate("c");

    EXPECT_EQ(map.values().size(), 3u);
}

// Все потоки, запросившие один ключ, получают один объект
TEST_F(ThreadSafeMapTest, ConcurrentGetOrCreate_SingleInstance) {
    const int THREADS = 16;
    std::vector<std::thread> threads;
    std::vector<KeyState*> seen(THREADS, nullptr);
    std::atomic<bool> go{false};

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([this, &seen, &go, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            seen[i] = map.getOrCreate("contended").get();
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    std::set<KeyState*> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(map.size(), 1u);
}

// Мьютекс из таблицы действительно сериализует доступ к ключу
TEST_F(ThreadSafeMapTest, SharedStateMutex_SerializesUpdates) {
    const int THREADS = 8;
    const int INCREMENTS = 1000;
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([this]() {
            for (int j = 0; j < INCREMENTS; ++j) {
                auto state = map.getOrCreate("P1/L1");
                std::lock_guard<std::mutex> lock(state->mutex);
                ++state->counter;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.find("P1/L1")->counter, THREADS * INCREMENTS);
}

// Тест гарантии видимости - после insert, find ОБЯЗАТЕЛЬНО вернёт данные
TEST_F(ThreadSafeMapTest, VisibilityGuarantee) {
    std::thread writer([this]() {
        auto state = std::make_shared<KeyState>();
        state->counter = 42;
        map.insert("visible", state);
    });
    writer.join();

    auto found = map.find("visible");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->counter, 42);
}
