#include <gtest/gtest.h>
#include <cctype>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

#include "../storage/GameStore.hpp"
#include "TestSupport.hpp"

using namespace MemoryDuel;

TEST(GameStore, InsertAssignsShortUniqueIds)
{
    GameStore store;
    std::set<std::string> ids;

    for (int i = 0; i < 200; ++i)
    {
        auto id = store.insert(test::makeBoard(2));
        ASSERT_EQ(id.size(), 6u);
        for (char c : id)
        {
            EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c)));
        }
        ids.insert(id);
    }

    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(store.size(), 200u);
}

TEST(GameStore, StoredStateCarriesItsId)
{
    GameStore store;
    auto id = store.insert(test::makeBoard(2));

    auto state = store.getGameState(id);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->gameId, id);
    EXPECT_TRUE(store.exists(id));
}

TEST(GameStore, UnknownIdIsReported)
{
    GameStore store;
    bool called = false;

    EXPECT_FALSE(store.withGame("NOPE00", [&](GameState&) { called = true; }));
    EXPECT_FALSE(called);
    EXPECT_FALSE(store.getGameState("NOPE00").has_value());
    EXPECT_FALSE(store.exists("NOPE00"));
}

TEST(GameStore, WithGameMutatesStoredState)
{
    GameStore store;
    auto id = store.insert(test::makeBoard(2));

    EXPECT_TRUE(store.withGame(id, [](GameState& s) { s.moves = 7; }));
    EXPECT_EQ(store.getGameState(id)->moves, 7);
}

TEST(GameStore, SnapshotsAreCopies)
{
    GameStore store;
    auto id = store.insert(test::makeBoard(2));

    auto snapshot = store.getGameState(id);
    snapshot->moves = 99;
    EXPECT_EQ(store.getGameState(id)->moves, 0);
}

TEST(GameStore, ConcurrentMutationsAreSerialized)
{
    GameStore store;
    auto id = store.insert(test::makeBoard(2));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&]() {
            for (int i = 0; i < 500; ++i)
            {
                store.withGame(id, [](GameState& s) { ++s.moves; });
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.getGameState(id)->moves, 4000);
}

TEST(GameStore, WithGameRefreshesActivity)
{
    GameStore store;
    auto id = store.insert(test::makeBoard(2));
    auto before = store.getGameState(id)->lastActivity;

    store.withGame(id, [](GameState&) {});
    EXPECT_GE(store.getGameState(id)->lastActivity, before);
    EXPECT_EQ(store.getGameState(id)->createdAt, before);
}

TEST(GameStore, ReapDropsGamesIdleBeyondTtl)
{
    GameStore store(std::chrono::minutes(30));
    auto first = store.insert(test::makeBoard(2));
    store.insert(test::makeBoard(2));
    auto stamp = store.getGameState(first)->lastActivity;

    EXPECT_EQ(store.reapExpired(stamp + std::chrono::minutes(29)), 0u);
    EXPECT_EQ(store.size(), 2u);

    EXPECT_EQ(store.reapExpired(std::chrono::system_clock::now() + std::chrono::minutes(31)), 2u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(store.exists(first));
}

TEST(GameStore, ZeroTtlNeverReaps)
{
    GameStore store(std::chrono::minutes(0));
    store.insert(test::makeBoard(2));

    auto farFuture = std::chrono::system_clock::now() + std::chrono::hours(24 * 365);
    EXPECT_EQ(store.reapExpired(farFuture), 0u);
    EXPECT_EQ(store.size(), 1u);
}

TEST(GameStore, ReapSkipsBusyGamesWithoutBlockingOthers)
{
    GameStore store(std::chrono::minutes(30));
    auto busy = store.insert(test::makeBoard(2));
    auto idle = store.insert(test::makeBoard(2));

    std::promise<void> holding;
    std::promise<void> release;
    auto released = release.get_future();
    std::thread player([&]() {
        store.withGame(busy, [&](GameState&) {
            holding.set_value();
            released.wait();
        });
    });
    holding.get_future().wait();

    auto later = std::chrono::system_clock::now() + std::chrono::minutes(45);
    auto reaping = std::async(std::launch::async, [&]() { return store.reapExpired(later); });
    auto reapStatus = reaping.wait_for(std::chrono::seconds(2));

    auto lookup = std::async(std::launch::async, [&]() { return store.size(); });
    auto lookupStatus = lookup.wait_for(std::chrono::seconds(2));

    release.set_value();
    player.join();

    ASSERT_EQ(reapStatus, std::future_status::ready);
    EXPECT_EQ(lookupStatus, std::future_status::ready);
    EXPECT_EQ(reaping.get(), 1u);
    EXPECT_TRUE(store.exists(busy));
    EXPECT_FALSE(store.exists(idle));
}
