#include <gtest/gtest.h>
#include <algorithm>
#include <memory>

#include "../engine/CommentarySystem.hpp"
#include "TestSupport.hpp"

using namespace MemoryDuel;
using MemoryDuel::test::RecordingCommentary;

namespace
{
    bool contains(const std::string& text, std::string_view needle)
    {
        return text.find(needle) != std::string::npos;
    }

    bool isFallbackTaunt(const std::string& text)
    {
        const auto& taunts = CommentaryProvider::FallbackTaunts;
        return std::find(taunts.begin(), taunts.end(), text) != taunts.end();
    }

    GameState played(int pairs, int moves, int matches, GameMode mode = GameMode::Solo)
    {
        auto state = test::makeBoard(pairs, mode);
        state.moves = moves;
        state.matches = matches;
        state.player1.attempts = moves;
        state.player1.pairsWon = matches;
        return state;
    }
}

TEST(CommentarySystem, SeatLabelsFollowMode)
{
    auto solo = test::makeBoard(2, GameMode::Solo);
    auto ai = test::makeBoard(2, GameMode::VsAi);
    auto duel = test::makeBoard(2, GameMode::VsHuman);

    EXPECT_EQ(CommentarySystem::seatLabel(solo, Seat::Player1), "Player");
    EXPECT_EQ(CommentarySystem::seatLabel(ai, Seat::Player1), "Player");
    EXPECT_EQ(CommentarySystem::seatLabel(ai, Seat::Player2), "The AI");
    EXPECT_EQ(CommentarySystem::seatLabel(duel, Seat::Player1), "Player 1");
    EXPECT_EQ(CommentarySystem::seatLabel(duel, Seat::Player2), "Player 2");
}

TEST(CommentarySystem, EndgamePraisesNearOptimalClear)
{
    auto state = played(6, 9, 6);
    auto prompt = CommentarySystem::matchPrompt(state, Seat::Player1);
    EXPECT_TRUE(contains(prompt, "won 6-pair memory in 9 moves (near optimal)"));
}

TEST(CommentarySystem, EndgameMocksSlowClear)
{
    auto state = played(6, 10, 6);
    auto prompt = CommentarySystem::matchPrompt(state, Seat::Player1);
    EXPECT_TRUE(contains(prompt, "took 10 moves for 6 pairs"));
    EXPECT_TRUE(contains(prompt, "Gentle mock"));
}

TEST(CommentarySystem, MidGameMatchPromptDependsOnEfficiency)
{
    // 6 / 7 is above 80 percent.
    auto sharp = played(6, 7, 3);
    EXPECT_TRUE(contains(CommentarySystem::matchPrompt(sharp, Seat::Player1), "doing very well"));

    // 6 / 8 is exactly 75 percent.
    auto slow = played(6, 8, 3);
    EXPECT_TRUE(contains(CommentarySystem::matchPrompt(slow, Seat::Player1), "struggling"));
}

TEST(CommentarySystem, MissPromptCallsOutRepeatedMistake)
{
    auto state = played(6, 5, 0);
    state.mistakes = { "Item0-Item1", "Item2-Item3", "Item0-Item1", "Item0-Item1" };

    auto prompt = CommentarySystem::missPrompt(state, Seat::Player1);
    EXPECT_TRUE(contains(prompt, "same wrong pair 3 times"));
}

TEST(CommentarySystem, MissPromptEscalatesWithMoveCount)
{
    auto state = played(6, 12, 1);
    state.mistakes = { "Item0-Item1" };
    EXPECT_TRUE(contains(CommentarySystem::missPrompt(state, Seat::Player1), "at 12 moves for 6 pairs"));

    state.moves = 11;
    EXPECT_TRUE(contains(CommentarySystem::missPrompt(state, Seat::Player1), "missed. Short sassy comment"));
}

TEST(CommentarySystem, RoastPromptScalesWithMoveRatio)
{
    auto savage = played(6, 19, 2);
    EXPECT_TRUE(contains(CommentarySystem::roastPrompt(savage, Seat::Player1), "Savage roast"));
    EXPECT_TRUE(contains(CommentarySystem::roastPrompt(savage, Seat::Player1), "2/6 pairs"));

    auto struggling = played(6, 13, 2);
    EXPECT_TRUE(contains(CommentarySystem::roastPrompt(struggling, Seat::Player1), "Struggling"));

    auto fine = played(6, 12, 5);
    EXPECT_TRUE(contains(CommentarySystem::roastPrompt(fine, Seat::Player1), "doing well"));
}

TEST(CommentarySystem, RoastUsesTheRequestedSeatsPairs)
{
    auto state = played(6, 4, 3, GameMode::VsHuman);
    state.player2.pairsWon = 1;

    auto prompt = CommentarySystem::roastPrompt(state, Seat::Player2);
    EXPECT_TRUE(contains(prompt, "Player 2"));
    EXPECT_TRUE(contains(prompt, "1/6 pairs"));
}

TEST(CommentarySystem, MatchCommentaryIsGatedByFrequency)
{
    auto provider = std::make_shared<RecordingCommentary>();
    CommentarySystem commentary(provider);

    auto state = played(6, 4, 2);
    EXPECT_FALSE(commentary.afterMatch(state, Seat::Player1).has_value());

    state.matches = 3;
    auto entry = commentary.afterMatch(state, Seat::Player1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->type, CommentaryType::Match);
    EXPECT_EQ(entry->text, "nice one");
    EXPECT_EQ(entry->move, 4);
    EXPECT_EQ(provider->seen().size(), 1u);
}

TEST(CommentarySystem, ClearingTheBoardAlwaysComments)
{
    auto provider = std::make_shared<RecordingCommentary>();
    CommentarySystem commentary(provider);

    auto state = played(2, 2, 2);
    auto entry = commentary.afterMatch(state, Seat::Player1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->type, CommentaryType::Endgame);
}

TEST(CommentarySystem, MissCommentaryIsGatedByMoves)
{
    auto provider = std::make_shared<RecordingCommentary>();
    CommentarySystem commentary(provider);

    auto state = played(6, 5, 0);
    state.mistakes = { "Item0-Item1" };
    EXPECT_FALSE(commentary.afterMiss(state, Seat::Player1).has_value());

    state.moves = 6;
    auto entry = commentary.afterMiss(state, Seat::Player1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->type, CommentaryType::Miss);
}

TEST(CommentarySystem, FallsBackWhenProviderFailsOrIsSilent)
{
    auto provider = std::make_shared<RecordingCommentary>();
    CommentarySystem commentary(provider);
    auto state = played(6, 6, 1);

    provider->throwOnCall = true;
    EXPECT_TRUE(isFallbackTaunt(commentary.roast(state, Seat::Player1)));

    provider->throwOnCall = false;
    provider->reply.clear();
    EXPECT_TRUE(isFallbackTaunt(commentary.roast(state, Seat::Player1)));

    CommentarySystem offline(nullptr);
    EXPECT_TRUE(isFallbackTaunt(offline.roast(state, Seat::Player1)));
}
