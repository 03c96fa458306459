//! # Session Layer Tests
//!
//! Session keys, the in-memory store, the durable TTL store, interactive
//! flows and per-key locks.

#include "session/durable_store.hpp"
#include "session/interactive_session.hpp"
#include "session/session_key.hpp"
#include "session/session_locks.hpp"
#include "session/session_store.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace pjsk;
using namespace pjsk::session;
namespace fs = std::filesystem;

namespace {

auto sample_config() -> card::RenderConfig {
    return card::RenderConfig{"hello", 48, 1.5, true, 12, -24, "星乃一歌"};
}

auto read_file(const fs::path& path) -> std::string {
    std::ifstream f(path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::trunc);
    f << content;
}

} // namespace

// ============================================================================
// Session Keys
// ============================================================================

TEST(SessionKeyTest, IdentityFallbackOrder) {
    RequesterInfo all{"qq", "group-1", "10001", "alice"};
    EXPECT_EQ(resolve_identity(all), "group-1");

    RequesterInfo no_session{"qq", "", "10001", "alice"};
    EXPECT_EQ(resolve_identity(no_session), "10001");

    RequesterInfo name_only{"qq", std::nullopt, std::nullopt, "alice"};
    EXPECT_EQ(resolve_identity(name_only), "alice");

    RequesterInfo nothing{"qq", std::nullopt, std::nullopt, std::nullopt};
    EXPECT_EQ(resolve_identity(nothing), "unknown");
}

TEST(SessionKeyTest, StorageKeyAndEmptyChannel) {
    auto key = make_session_key({"qq", std::nullopt, "10001", std::nullopt});
    EXPECT_EQ(key.storage_key(), "qq:10001");

    auto fallback = make_session_key({"", std::nullopt, "10001", std::nullopt});
    EXPECT_EQ(fallback.channel(), "unknown");
}

TEST(SessionKeyTest, RejectsEmptyParts) {
    EXPECT_THROW(SessionKey("", "x"), std::invalid_argument);
    EXPECT_THROW(SessionKey("x", ""), std::invalid_argument);
}

TEST(SessionKeyTest, EqualityAndHash) {
    SessionKey a("qq", "1");
    SessionKey b("qq", "1");
    SessionKey c("wx", "1");
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_EQ(std::hash<SessionKey>{}(a), std::hash<SessionKey>{}(b));
}

// ============================================================================
// SessionStore
// ============================================================================

TEST(SessionStoreTest, SetGetEraseAreIsolatedPerKey) {
    SessionStore store;
    SessionKey alice("qq", "alice");
    SessionKey bob("qq", "bob");

    EXPECT_FALSE(store.get(alice).has_value());
    store.set(alice, sample_config());
    EXPECT_TRUE(store.exists(alice));
    EXPECT_FALSE(store.exists(bob));

    auto copy = store.get(alice);
    ASSERT_TRUE(copy.has_value());
    copy->font_size = 18;
    EXPECT_EQ(store.get(alice)->font_size, 48);

    EXPECT_TRUE(store.erase(alice));
    EXPECT_FALSE(store.erase(alice));
    EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, StaleEntriesAreMisses) {
    double now = 1000.0;
    SessionStore store([&now] { return now; });
    SessionKey alice("qq", "alice");
    SessionKey bob("qq", "bob");

    store.set(alice, sample_config());
    now += 10 * 3600.0;
    store.set(bob, sample_config());
    EXPECT_TRUE(store.get(alice, 24).has_value());

    now += 20 * 3600.0;
    EXPECT_FALSE(store.get(alice, 24).has_value());
    EXPECT_FALSE(store.exists(alice));
    EXPECT_TRUE(store.get(bob, 24).has_value());
}

TEST(SessionStoreTest, SetRefreshesAndEvictExpiredSweeps) {
    double now = 1000.0;
    SessionStore store([&now] { return now; });
    SessionKey alice("qq", "alice");
    SessionKey bob("qq", "bob");

    store.set(alice, sample_config());
    store.set(bob, sample_config());
    now += 23 * 3600.0;
    store.set(alice, sample_config());
    now += 2 * 3600.0;

    EXPECT_EQ(store.evict_expired(24), 1u);
    EXPECT_TRUE(store.exists(alice));
    EXPECT_FALSE(store.exists(bob));
    EXPECT_EQ(store.evict_expired(24), 0u);
}

// ============================================================================
// DurableStore
// ============================================================================

class DurableStoreTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path path;
    double now = 1718000000.0;
    Clock clock = [this] { return now; };
    SessionKey key{"qq", "10001"};

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("pjsk_store_") + info->name());
        fs::remove_all(dir);
        path = dir / "nested" / "states.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TEST_F(DurableStoreTest, MissingDocumentReadsEmpty) {
    DurableStore store(path, clock);
    EXPECT_FALSE(store.get(key, 24).has_value());
    EXPECT_TRUE(store.get_all().empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(DurableStoreTest, SetCreatesDirectoriesAndRestores) {
    DurableStore store(path, clock);
    ASSERT_TRUE(store.set(key, sample_config()));
    ASSERT_TRUE(fs::exists(path));

    DurableStore reopened(path, clock);
    auto restored = reopened.get(key, 24);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, sample_config());

    auto content = read_file(path);
    EXPECT_NE(content.find("\"states\""), std::string::npos);
    EXPECT_NE(content.find("\"qq:10001\""), std::string::npos);
    EXPECT_NE(content.find("\"timestamp\""), std::string::npos);
    EXPECT_NE(content.find("\"last_updated\""), std::string::npos);
}

TEST_F(DurableStoreTest, ExpiredEntryIsDeletedOnRead) {
    DurableStore store(path, clock);
    ASSERT_TRUE(store.set(key, sample_config()));

    now += 24 * 3600.0;
    EXPECT_TRUE(store.get(key, 24).has_value());

    now += 1.0;
    EXPECT_FALSE(store.get(key, 24).has_value());
    EXPECT_EQ(read_file(path).find("qq:10001"), std::string::npos);
}

TEST_F(DurableStoreTest, CleanupRemovesOnlyExpired) {
    DurableStore store(path, clock);
    ASSERT_TRUE(store.set(SessionKey("qq", "old"), sample_config()));
    now += 10 * 3600.0;
    ASSERT_TRUE(store.set(SessionKey("qq", "new"), sample_config()));

    now += 20 * 3600.0;
    EXPECT_EQ(store.cleanup_expired(24), 1u);
    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all.begin()->first, "qq:new");

    EXPECT_EQ(store.cleanup_expired(24), 0u);
}

TEST_F(DurableStoreTest, RemoveEntry) {
    DurableStore store(path, clock);
    ASSERT_TRUE(store.set(key, sample_config()));
    EXPECT_TRUE(store.remove(key));
    EXPECT_FALSE(store.remove(key));
    EXPECT_FALSE(store.get(key, 24).has_value());
}

TEST_F(DurableStoreTest, CorruptDocumentReadsEmptyAndIsReplacedOnWrite) {
    write_file(path, "{ this is not json");
    DurableStore store(path, clock);
    EXPECT_FALSE(store.get(key, 24).has_value());

    ASSERT_TRUE(store.set(key, sample_config()));
    EXPECT_TRUE(store.get(key, 24).has_value());
}

TEST_F(DurableStoreTest, LegacyStateKeyAndMissingTimestamp) {
    write_file(path, R"({
  "states": {
    "qq:10001": {
      "state": {"text": "legacy", "font_size": 40, "line_spacing": 1.0,
                "curve_enabled": false, "offset_x": 0, "offset_y": 0, "role": "初音未来"}
    }
  }
})");
    DurableStore store(path, clock);
    now += 1000 * 3600.0;
    auto restored = store.get(key, 24);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->text, "legacy");
    EXPECT_EQ(store.cleanup_expired(24), 0u);
}

TEST_F(DurableStoreTest, MalformedEntryIsSkipped) {
    write_file(path, R"({"states": {"qq:10001": {"config": {"text": 5}, "timestamp": 1718000000.0},
                                    "qq:ok": {"config": {"text": "t", "font_size": 40,
                                              "line_spacing": 1.0, "curve_enabled": true,
                                              "offset_x": 0, "offset_y": 0, "role": "r"},
                                              "timestamp": 1718000000.0}}})");
    DurableStore store(path, clock);
    EXPECT_FALSE(store.get(key, 24).has_value());
    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all.at("qq:ok").curve_enabled);
}

// ============================================================================
// InteractiveSessionManager
// ============================================================================

class InteractiveSessionTest : public ::testing::Test {
protected:
    double now = 5000.0;
    InteractiveSessionManager manager{[this] { return now; }};
    SessionKey key{"qq", "10001"};
};

TEST_F(InteractiveSessionTest, CreateAndGet) {
    auto flow = manager.create(key);
    EXPECT_EQ(flow.state, FlowState::WaitingCharacterSelection);
    EXPECT_EQ(flow.flow_id, "qq_10001_5000");
    EXPECT_DOUBLE_EQ(flow.timeout_seconds, 30.0);

    auto fetched = manager.get(key);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->flow_id, flow.flow_id);
}

TEST_F(InteractiveSessionTest, CreateReplacesExistingFlow) {
    manager.create(key);
    now += 5;
    auto second = manager.create(key, FlowState::WaitingTextInput);
    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.get(key)->state, FlowState::WaitingTextInput);
    EXPECT_EQ(second.flow_id, "qq_10001_5005");
}

TEST_F(InteractiveSessionTest, ExpiresLazily) {
    manager.create(key);
    now += 30;
    EXPECT_TRUE(manager.get(key).has_value());
    now += 1;
    EXPECT_FALSE(manager.get(key).has_value());
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(InteractiveSessionTest, UpdateRefreshesActivity) {
    manager.create(key);
    now += 25;
    auto updated = manager.update(key, std::nullopt, "星乃一歌");
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->selected_persona, "星乃一歌");

    now += 25;
    EXPECT_TRUE(manager.get(key).has_value());
}

TEST_F(InteractiveSessionTest, TerminalStateRemovesFlow) {
    manager.create(key);
    auto done = manager.update(key, FlowState::Completed);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->state, FlowState::Completed);
    EXPECT_FALSE(manager.get(key).has_value());
    EXPECT_FALSE(manager.update(key, FlowState::Completed).has_value());
}

TEST_F(InteractiveSessionTest, Cancel) {
    EXPECT_FALSE(manager.cancel(key));
    manager.create(key);
    EXPECT_TRUE(manager.cancel(key));
    EXPECT_FALSE(manager.get(key).has_value());
}

TEST_F(InteractiveSessionTest, SweepExpired) {
    manager.create(SessionKey("qq", "a"), FlowState::WaitingCharacterSelection, 10);
    manager.create(SessionKey("qq", "b"), FlowState::WaitingCharacterSelection, 60);
    now += 20;
    EXPECT_EQ(manager.sweep_expired(), 1u);
    EXPECT_EQ(manager.size(), 1u);
}

TEST(FlowStateTest, Names) {
    EXPECT_STREQ(flow_state_name(FlowState::WaitingCharacterSelection),
                 "waiting_character_selection");
    EXPECT_STREQ(flow_state_name(FlowState::Timeout), "timeout");
}

// ============================================================================
// SessionLocks
// ============================================================================

TEST(SessionLocksTest, SameKeyIsSerialized) {
    SessionLocks locks;
    SessionKey key("qq", "1");
    int counter = 0;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto guard = locks.lock(key);
                if (inside.fetch_add(1) != 0) {
                    overlapped = true;
                }
                ++counter;
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counter, 1600);
    EXPECT_FALSE(overlapped.load());
    EXPECT_EQ(locks.size(), 0u);
}

TEST(SessionLocksTest, DistinctKeysDoNotContend) {
    SessionLocks locks;
    {
        auto first = locks.lock(SessionKey("qq", "1"));
        auto second = locks.lock(SessionKey("qq", "2"));
        EXPECT_TRUE(first.owns_lock());
        EXPECT_TRUE(second.owns_lock());
        EXPECT_EQ(locks.size(), 2u);
    }
    EXPECT_EQ(locks.size(), 0u);
}

TEST(SessionLocksTest, IdleSlotsAreDropped) {
    SessionLocks locks;
    for (int i = 0; i < 100; ++i) {
        auto guard = locks.lock(SessionKey("qq", std::to_string(i)));
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);

    auto moved_from = locks.lock(SessionKey("qq", "a"));
    {
        SessionLock moved(std::move(moved_from));
        EXPECT_TRUE(moved.owns_lock());
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);
}
