#include <gtest/gtest.h>
#include <vector>
#include "holdem/engine.hpp"
#include "holdem/random_source.hpp"
#include "test_support.hpp"

using namespace holdem;
using holdem::test::fingerprint;
using holdem::test::seated_table;

// =============================================================================
// Fixture: three players, p1 on the button, p2 small blind, p3 big blind
// =============================================================================

class BettingRoundTest : public ::testing::Test {
protected:
    void SetUp() override {
        table = seated_table(3);
    }

    void deal() {
        MersenneRandomSource rng(21);
        ASSERT_TRUE(start_hand(table, rng).ok());
        ASSERT_EQ(table.current_player_index, 0);
    }

    /// Everyone limps and the big blind checks: the flop is out and p2 acts.
    void deal_to_flop() {
        deal();
        ASSERT_TRUE(player_action(table, "p1", ActionType::Call).ok());
        ASSERT_TRUE(player_action(table, "p2", ActionType::Call).ok());
        ASSERT_TRUE(player_action(table, "p3", ActionType::Check).ok());
        ASSERT_EQ(table.phase, Phase::Flop);
        ASSERT_EQ(table.current_player_index, 1);
    }

    void expect_rejected(const OperationResult& result, RejectionKind kind) {
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error->kind, kind) << result.error->message;
    }

    Table table;
};

// =============================================================================
// Turn Violations
// =============================================================================

TEST_F(BettingRoundTest, ActOutOfTurn_ShouldRejectWithoutChange) {
    deal();
    auto before = fingerprint(table);

    auto result = player_action(table, "p2", ActionType::Call);

    expect_rejected(result, RejectionKind::TurnViolation);
    EXPECT_EQ(result.error->message, "It is not your turn.");
    EXPECT_EQ(fingerprint(table), before);
}

TEST_F(BettingRoundTest, UnknownPlayer_ShouldRejectNotFound) {
    deal();

    expect_rejected(player_action(table, "ghost", ActionType::Fold), RejectionKind::NotFound);
}

TEST_F(BettingRoundTest, NoHandInProgress_ShouldRejectTurnViolation) {
    auto result = player_action(table, "p1", ActionType::Check);

    expect_rejected(result, RejectionKind::TurnViolation);
    EXPECT_EQ(result.error->message, "No active betting round.");
}

TEST_F(BettingRoundTest, UnknownActionTag_ShouldRejectInvalidArgument) {
    deal();

    auto result = player_action(table, "p1", "dance");

    expect_rejected(result, RejectionKind::InvalidArgument);
    EXPECT_EQ(result.error->message, "Unknown action: dance");
}

TEST_F(BettingRoundTest, ActionTag_ShouldBeAccepted) {
    deal();

    auto result = player_action(table, "p1", "call");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(table.seats[0].last_action, "Call $10");
}

// =============================================================================
// Sizing
// =============================================================================

TEST_F(BettingRoundTest, CheckFacingBet_ShouldRejectIllegalSizing) {
    deal();

    auto result = player_action(table, "p1", ActionType::Check);

    expect_rejected(result, RejectionKind::IllegalSizing);
    EXPECT_EQ(result.error->message, "You must call, raise, or fold.");
}

TEST_F(BettingRoundTest, BetFacingBet_ShouldReject) {
    deal();

    expect_rejected(player_action(table, "p1", ActionType::Bet, 50), RejectionKind::IllegalSizing);
}

TEST_F(BettingRoundTest, RaiseBelowMinimum_ShouldReject) {
    deal();

    auto result = player_action(table, "p1", ActionType::Raise, 15);

    expect_rejected(result, RejectionKind::IllegalSizing);
    EXPECT_EQ(result.error->message, "Raise must be to at least $20.");
}

TEST_F(BettingRoundTest, RaiseTo_ShouldReopenBetting) {
    deal();

    auto result = player_action(table, "p1", ActionType::Raise, 30);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(table.seats[0].bet, 30);
    EXPECT_EQ(table.seats[0].chips, 970);
    EXPECT_EQ(table.seats[0].last_action, "Raise to $30");
    EXPECT_EQ(table.current_bet, 30);
    EXPECT_EQ(table.min_raise, 20);
    EXPECT_EQ(table.last_raiser_index, 0);
    EXPECT_EQ(table.players_acted_this_round, (std::set<int>{0}));
    EXPECT_EQ(table.current_player_index, 1);
    EXPECT_EQ(table.pot, 45);
}

TEST_F(BettingRoundTest, RaiseWithZeroAmount_ShouldUseMinimum) {
    deal();

    ASSERT_TRUE(player_action(table, "p1", ActionType::Raise).ok());

    EXPECT_EQ(table.current_bet, 20);
    EXPECT_EQ(min_raise_to(table), 30);
}

TEST_F(BettingRoundTest, RaiseBeyondStack_ShouldGoAllIn) {
    deal();

    ASSERT_TRUE(player_action(table, "p1", ActionType::Raise, 5000).ok());

    EXPECT_TRUE(table.seats[0].all_in);
    EXPECT_EQ(table.seats[0].chips, 0);
    EXPECT_EQ(table.seats[0].bet, 1000);
    EXPECT_EQ(table.seats[0].last_action, "All-In $1000");
    EXPECT_EQ(table.current_bet, 1000);
    EXPECT_EQ(table.min_raise, 990);
}

TEST_F(BettingRoundTest, CallWithNothingToCall_ShouldReject) {
    deal_to_flop();

    auto result = player_action(table, "p2", ActionType::Call);

    expect_rejected(result, RejectionKind::IllegalSizing);
    EXPECT_EQ(result.error->message, "Nothing to call. Check instead.");
}

TEST_F(BettingRoundTest, RaiseWithoutBet_ShouldReject) {
    deal_to_flop();

    expect_rejected(player_action(table, "p2", ActionType::Raise, 40), RejectionKind::IllegalSizing);
}

TEST_F(BettingRoundTest, BetBelowBigBlind_ShouldReject) {
    deal_to_flop();

    expect_rejected(player_action(table, "p2", ActionType::Bet, 5), RejectionKind::IllegalSizing);
}

TEST_F(BettingRoundTest, BetAboveStack_ShouldReject) {
    deal_to_flop();

    auto result = player_action(table, "p2", ActionType::Bet, 5000);

    expect_rejected(result, RejectionKind::IllegalSizing);
    EXPECT_EQ(result.error->message, "Not enough chips. You have $990.");
}

TEST_F(BettingRoundTest, BetWithZeroAmount_ShouldBetBigBlind) {
    deal_to_flop();

    ASSERT_TRUE(player_action(table, "p2", ActionType::Bet).ok());

    EXPECT_EQ(table.seats[1].bet, 10);
    EXPECT_EQ(table.seats[1].last_action, "Bet $10");
    EXPECT_EQ(table.current_bet, 10);
    EXPECT_EQ(table.min_raise, 10);
    EXPECT_EQ(table.current_player_index, 2);
}

// =============================================================================
// Round Completion
// =============================================================================

TEST_F(BettingRoundTest, BigBlindOption_ShouldBeOfferedAfterLimps) {
    deal();
    ASSERT_TRUE(player_action(table, "p1", ActionType::Call).ok());
    ASSERT_TRUE(player_action(table, "p2", ActionType::Call).ok());

    // Then the big blind still acts before the flop
    EXPECT_EQ(table.phase, Phase::Preflop);
    EXPECT_EQ(table.current_player_index, 2);
    EXPECT_EQ(get_valid_actions(table),
              (std::vector<ActionType>{ActionType::Fold, ActionType::Check,
                                       ActionType::Raise, ActionType::AllIn}));
    EXPECT_EQ(amount_to_call(table), 0);
}

TEST_F(BettingRoundTest, NewStreet_ShouldResetBetsAndStartLeftOfButton) {
    deal_to_flop();

    EXPECT_EQ(table.community_cards.size(), 3u);
    EXPECT_EQ(table.current_bet, 0);
    EXPECT_EQ(table.min_raise, 10);
    EXPECT_EQ(table.pot, 30);
    for (const auto& seat : table.seats) {
        EXPECT_EQ(seat.bet, 0);
        EXPECT_EQ(seat.total_bet_this_hand, 10);
    }
    EXPECT_EQ(get_valid_actions(table),
              (std::vector<ActionType>{ActionType::Fold, ActionType::Check,
                                       ActionType::Bet, ActionType::AllIn}));
}

TEST_F(BettingRoundTest, BetCallFold_ShouldCompleteRound) {
    // Given the flop with p2, p3, p1 to act in that order
    deal_to_flop();

    // When p2 bets 10, p3 calls and p1 folds
    ASSERT_TRUE(player_action(table, "p2", ActionType::Bet, 10).ok());
    ASSERT_TRUE(player_action(table, "p3", ActionType::Call).ok());
    auto result = player_action(table, "p1", ActionType::Fold);

    // Then the turn is dealt without another action from anyone
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.phase, Phase::Turn);
    EXPECT_EQ(table.community_cards.size(), 4u);
    EXPECT_EQ(table.current_player_index, 1);
}

TEST_F(BettingRoundTest, ChecksAround_ShouldReachShowdown) {
    deal_to_flop();

    for (int street = 0; street < 3; ++street) {
        ASSERT_TRUE(player_action(table, "p2", ActionType::Check).ok());
        ASSERT_TRUE(player_action(table, "p3", ActionType::Check).ok());
        auto result = player_action(table, "p1", ActionType::Check);
        ASSERT_TRUE(result.ok());
        if (street == 2) {
            EXPECT_EQ(result.phase, Phase::Finished);
            ASSERT_TRUE(result.result.has_value());
            EXPECT_EQ(result.result->showdown.size(), 3u);
            EXPECT_EQ(result.result->total_awarded(), 30);
        }
    }
    EXPECT_EQ(table.pot, 0);
    EXPECT_EQ(test::stacks(table), 3000);
}

TEST_F(BettingRoundTest, FoldToOne_ShouldAwardPotImmediately) {
    deal();
    ASSERT_TRUE(player_action(table, "p1", ActionType::Raise, 40).ok());
    ASSERT_TRUE(player_action(table, "p2", ActionType::Fold).ok());

    auto result = player_action(table, "p3", ActionType::Fold);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.phase, Phase::Finished);
    ASSERT_TRUE(result.result.has_value());
    EXPECT_TRUE(result.result->uncontested);
    EXPECT_TRUE(result.result->showdown.empty());
    EXPECT_EQ(table.seats[0].chips, 1015);
    EXPECT_TRUE(table.community_cards.empty());
}

// =============================================================================
// All-In Rules
// =============================================================================

TEST_F(BettingRoundTest, ShortAllInRaise_ShouldNotReopenBetting) {
    // Given p3 left with 5 chips after the preflop limp
    table.seats[2].chips = 15;
    deal_to_flop();
    ASSERT_TRUE(player_action(table, "p2", ActionType::Bet, 20).ok());

    // When p3 raises all-in for less than a full raise
    auto result = player_action(table, "p3", ActionType::Raise, 100);

    // Then the bet to match is unchanged and p2 is not asked to act again
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(table.seats[2].all_in);
    EXPECT_EQ(table.seats[2].last_action, "All-In $5");
    EXPECT_EQ(table.current_bet, 20);
    EXPECT_EQ(table.min_raise, 20);
    EXPECT_EQ(table.last_raiser_index, 1);
    EXPECT_EQ(table.current_player_index, 0);

    ASSERT_TRUE(player_action(table, "p1", ActionType::Call).ok());
    EXPECT_EQ(table.phase, Phase::Turn);
}

TEST_F(BettingRoundTest, FullAllInRaise_ShouldReopenBetting) {
    table.seats[2].chips = 110;
    deal_to_flop();
    ASSERT_TRUE(player_action(table, "p2", ActionType::Bet, 20).ok());

    ASSERT_TRUE(player_action(table, "p3", ActionType::AllIn).ok());

    EXPECT_EQ(table.current_bet, 100);
    EXPECT_EQ(table.min_raise, 80);
    EXPECT_EQ(table.last_raiser_index, 2);
    EXPECT_EQ(table.players_acted_this_round, (std::set<int>{2}));
    ASSERT_TRUE(player_action(table, "p1", ActionType::Fold).ok());
    EXPECT_EQ(table.current_player_index, 1);
    EXPECT_EQ(amount_to_call(table), 80);
}

TEST(HeadsUpAllInTest, CallForLessThanStack_ShouldRunOutAndRefundExcess) {
    // Given p2 holding 25 chips
    Table table = seated_table(2);
    table.seats[1].chips = 25;
    MersenneRandomSource rng(8);
    ASSERT_TRUE(start_hand(table, rng).ok());

    // When p1 raises to 30 and p2 calls with the 15 they have left
    ASSERT_TRUE(player_action(table, "p1", ActionType::Raise, 30).ok());
    auto result = player_action(table, "p2", ActionType::Call);

    // Then the board runs out and the uncalled 5 goes back to p1
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(table.seats[1].last_action, "All-In (Call)");
    EXPECT_EQ(result.phase, Phase::Finished);
    EXPECT_EQ(table.community_cards.size(), 5u);
    ASSERT_TRUE(result.result.has_value());
    ASSERT_EQ(result.result->pots.size(), 2u);
    EXPECT_EQ(result.result->pots[0].amount, 50);
    EXPECT_EQ(result.result->pots[1].amount, 5);
    EXPECT_EQ(result.result->pots[1].winners, (std::vector<std::string>{"p1"}));
    EXPECT_EQ(test::stacks(table), 1025);
}

TEST(ValidActionsTest, ShortStackFacingBet_ShouldOnlyCallOrFold) {
    Table table = seated_table(3);
    table.seats[0].chips = 8;
    MersenneRandomSource rng(8);
    ASSERT_TRUE(start_hand(table, rng).ok());

    EXPECT_EQ(get_valid_actions(table),
              (std::vector<ActionType>{ActionType::Fold, ActionType::Call, ActionType::AllIn}));
    EXPECT_EQ(amount_to_call(table), 8);
    EXPECT_EQ(min_raise_to(table), 8);
}

TEST(ValidActionsTest, NoHand_ShouldBeEmpty) {
    Table table = seated_table(2);

    EXPECT_TRUE(get_valid_actions(table).empty());
    EXPECT_EQ(amount_to_call(table), 0);
}
