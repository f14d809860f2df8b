#include <gtest/gtest.h>
#include <memory>

#include "../engine/OpponentSystem.hpp"
#include "TestSupport.hpp"

using namespace MemoryDuel;
using MemoryDuel::test::ScriptedRandom;

namespace
{
    GameState aiBoard(int pairs, Difficulty ai)
    {
        auto state = test::makeBoard(pairs, GameMode::VsAi);
        state.settings.aiDifficulty = ai;
        state.currentPlayer = Seat::Player2;
        return state;
    }

    // Records a reveal of cardId without leaving it face-up.
    void seen(GameState& state, int cardId, Seat who = Seat::Player1)
    {
        const Card* card = state.findCard(cardId);
        state.moveHistory.push_back({
            .cardId = cardId,
            .pairKey = card->pairKey,
            .name = card->name,
            .moveNumber = static_cast<int>(state.moveHistory.size()) + 1,
            .player = who
            });
    }

    void faceUp(GameState& state, int cardId)
    {
        seen(state, cardId, Seat::Player2);
        state.findCard(cardId)->flipped = true;
        state.currentFlipped.push_back(cardId);
    }
}

TEST(OpponentSystem, FullBoardHasNoValidMoves)
{
    auto random = std::make_shared<ScriptedRandom>();
    OpponentSystem opponent(random);
    auto state = aiBoard(2, Difficulty::Hard);
    for (auto& c : state.cards) { c.flipped = true; c.matched = true; }

    auto result = opponent.chooseMove(state);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::NoValidMoves);
}

TEST(OpponentSystem, CompletesTheKnownMateOfTheFaceUpCard)
{
    auto random = std::make_shared<ScriptedRandom>();
    OpponentSystem opponent(random);
    auto state = aiBoard(6, Difficulty::Medium);

    seen(state, 7);
    seen(state, 2);
    faceUp(state, 6);

    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 7);
    EXPECT_EQ(random->chanceCalls, 0);
}

TEST(OpponentSystem, OpensAFullyKnownPair)
{
    auto random = std::make_shared<ScriptedRandom>();
    OpponentSystem opponent(random);
    auto state = aiBoard(6, Difficulty::Easy);

    seen(state, 4);
    seen(state, 0);
    seen(state, 5);

    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 4);
    EXPECT_EQ(random->chanceCalls, 0);
}

TEST(OpponentSystem, MatchedPairsAreNotReopened)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->picks = { 0 };
    OpponentSystem opponent(random);
    auto state = aiBoard(3, Difficulty::Hard);

    seen(state, 0);
    seen(state, 1);
    state.cards[0].matched = state.cards[0].flipped = true;
    state.cards[1].matched = state.cards[1].flipped = true;

    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_NE(result.cardId, 0);
    EXPECT_NE(result.cardId, 1);
    EXPECT_EQ(random->chanceCalls, 1);
}

TEST(OpponentSystem, EpsilonDrawPicksAnyAvailableCard)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->chances = { 0.49 };
    random->picks = { 3 };
    OpponentSystem opponent(random);
    auto state = aiBoard(4, Difficulty::Easy);
    seen(state, 0);

    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 3);
    EXPECT_EQ(random->chanceCalls, 1);
    EXPECT_EQ(random->pickCalls, 1);
}

TEST(OpponentSystem, EpsilonThresholdFollowsProfile)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->chances = { 0.49 };
    random->picks = { 0 };
    OpponentSystem opponent(random);
    auto state = aiBoard(4, Difficulty::Hard);
    seen(state, 0);

    // 0.49 is above the hard epsilon, so the unseen card 1 is explored instead of card 0.
    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 1);
}

TEST(OpponentSystem, PrefersUnseenCards)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->picks = { 2 };
    OpponentSystem opponent(random);
    auto state = aiBoard(4, Difficulty::Medium);
    seen(state, 0);
    seen(state, 2);
    seen(state, 4);

    // Unseen, in board order: 1, 3, 5, 6, 7.
    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 5);
}

TEST(OpponentSystem, FallsBackToAnyAvailableWhenEverythingWasSeen)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->picks = { 1 };
    OpponentSystem opponent(random);
    auto state = aiBoard(2, Difficulty::Hard);

    // Mismatch left face-up by a previous turn, not reset yet.
    seen(state, 1);
    seen(state, 3);
    state.cards[1].flipped = true;
    state.cards[3].flipped = true;
    seen(state, 0);
    seen(state, 2);

    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 2);
}

TEST(OpponentSystem, MemoryWindowForgetsOlderReveals)
{
    auto state = aiBoard(6, Difficulty::Easy);
    for (int id = 0; id < 8; ++id) seen(state, id);

    OpponentSystem::refreshMemory(state, OpponentProfile::forDifficulty(Difficulty::Easy));
    std::vector<int> remembered;
    for (const auto& [key, ids] : state.opponentMemory) remembered.insert(remembered.end(), ids.begin(), ids.end());
    EXPECT_EQ(remembered, (std::vector<int>{ 2, 3, 4, 5, 6, 7 }));

    OpponentSystem::refreshMemory(state, OpponentProfile::forDifficulty(Difficulty::Hard));
    EXPECT_EQ(state.opponentMemory.size(), 4u);
    EXPECT_EQ(state.opponentMemory[100], (std::vector<int>{ 0, 1 }));
}

TEST(OpponentSystem, ForgottenPairIsNotCompleted)
{
    auto random = std::make_shared<ScriptedRandom>();
    random->picks = { 1 };
    OpponentSystem opponent(random);
    auto state = aiBoard(8, Difficulty::Easy);

    seen(state, 1);
    for (int id : { 4, 6, 8, 10, 12, 14 }) seen(state, id);
    faceUp(state, 0);

    // Card 1 fell out of the six-move window, so the opponent explores instead.
    // Unseen, in board order: 1, 2, 3, 4, 5, 7, ...
    auto result = opponent.chooseMove(state);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.cardId, 2);
    EXPECT_EQ(random->chanceCalls, 1);
}

TEST(OpponentSystem, HardOpponentCompletesKnownPairsAtLeast95Percent)
{
    auto random = std::make_shared<MersenneRandomSource>(20261019);
    OpponentSystem opponent(random);

    int completed = 0;
    for (int trial = 0; trial < 1000; ++trial)
    {
        auto state = aiBoard(12, Difficulty::Hard);
        int target = (trial % 12) * 2;
        seen(state, target + 1);
        seen(state, (target + 2) % 24);
        faceUp(state, target);

        auto result = opponent.chooseMove(state);
        ASSERT_TRUE(result.success);
        if (result.cardId == target + 1) ++completed;
    }
    EXPECT_GE(completed, 950);
}

TEST(OpponentSystem, MemoryHudSortsBySeenCountAndCapsAtEight)
{
    auto state = aiBoard(12, Difficulty::Hard);
    for (int id = 0; id < 10; ++id) state.opponentMemory[100 + id] = { id * 2 };
    state.opponentMemory[105] = { 10, 11 };
    state.opponentMemory[999] = { 40 };

    auto hud = OpponentSystem::memoryHud(state);
    ASSERT_EQ(hud.size(), 8u);
    EXPECT_EQ(hud[0].pairKey, 105);
    EXPECT_EQ(hud[0].seen, 2);
    EXPECT_EQ(hud[0].name, "Item5");
    EXPECT_EQ(hud[1].pairKey, 100);
    EXPECT_EQ(hud[1].seen, 1);

    auto all = OpponentSystem::memoryHud(state, 20);
    EXPECT_EQ(all.back().pairKey, 999);
    EXPECT_EQ(all.back().name, "#999");
}
