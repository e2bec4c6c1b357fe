#include <gtest/gtest.h>
#include <vector>
#include "holdem/errors.hpp"
#include "holdem/table_state.hpp"
#include "holdem/validation.hpp"

using namespace holdem;

// =============================================================================
// Rejection Taxonomy
// =============================================================================

TEST(CommandRejectedErrorTest, Factories_ShouldMapToStatusCodes) {
    EXPECT_EQ(CommandRejectedError::turn_violation("x").status_code, grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(CommandRejectedError::illegal_sizing("x").status_code, grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(CommandRejectedError::lifecycle("x").status_code, grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(CommandRejectedError::not_found("x").status_code, grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(CommandRejectedError::invalid_argument("x").status_code, grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(CommandRejectedError::already_exists("x").status_code, grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(CommandRejectedError::resource_exhausted("x").status_code, grpc::StatusCode::RESOURCE_EXHAUSTED);
}

TEST(CommandRejectedErrorTest, Rejection_ShouldCopyKindCodeAndMessage) {
    auto error = CommandRejectedError::illegal_sizing("Bet must be at least $10.");

    auto rejection = Rejection::from(error);

    EXPECT_EQ(rejection.kind, RejectionKind::IllegalSizing);
    EXPECT_EQ(rejection.status_code, grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(rejection.message, "Bet must be at least $10.");
}

TEST(CommandRejectedErrorTest, KindNames_ShouldBeSnakeCase) {
    EXPECT_EQ(to_string(RejectionKind::TurnViolation), "turn_violation");
    EXPECT_EQ(to_string(RejectionKind::IllegalSizing), "illegal_sizing");
    EXPECT_EQ(to_string(RejectionKind::Lifecycle), "lifecycle");
    EXPECT_EQ(to_string(RejectionKind::NotFound), "not_found");
}

// =============================================================================
// Validation Helpers
// =============================================================================

TEST(ValidationTest, RequirePositive_ShouldRejectZero) {
    EXPECT_NO_THROW(validation::require_positive(1, "chips"));
    EXPECT_THROW(validation::require_positive(0, "chips"), CommandRejectedError);
}

TEST(ValidationTest, RequireIndex_ShouldAllowNoneWhenAsked) {
    EXPECT_NO_THROW(validation::require_index(-1, 3, "current", true));
    EXPECT_THROW(validation::require_index(-1, 3, "dealer"), CommandRejectedError);
    EXPECT_THROW(validation::require_index(3, 3, "dealer"), CommandRejectedError);
}

TEST(ValidationTest, RequireStatusIn_ShouldThrowSuppliedError) {
    auto error = CommandRejectedError::turn_violation("No active betting round.");
    std::vector<Phase> betting = {Phase::Preflop, Phase::Flop, Phase::Turn, Phase::River};

    EXPECT_NO_THROW(validation::require_status_in(Phase::Flop, betting, error));
    try {
        validation::require_status_in(Phase::Waiting, betting, error);
        FAIL() << "expected CommandRejectedError";
    } catch (const CommandRejectedError& e) {
        EXPECT_EQ(e.kind, RejectionKind::TurnViolation);
        EXPECT_STREQ(e.what(), "No active betting round.");
    }
}

// =============================================================================
// Tags
// =============================================================================

TEST(TagTest, ActionTags_ShouldRoundTrip) {
    for (auto action : {ActionType::Fold, ActionType::Check, ActionType::Call,
                        ActionType::Bet, ActionType::Raise, ActionType::AllIn}) {
        EXPECT_EQ(parse_action(to_string(action)), action);
    }
    EXPECT_EQ(parse_action("all-in"), ActionType::AllIn);
    EXPECT_FALSE(parse_action("shove").has_value());
}

TEST(TagTest, PhaseNames_ShouldBeLowerCase) {
    EXPECT_EQ(to_string(Phase::Waiting), "waiting");
    EXPECT_EQ(to_string(Phase::Showdown), "showdown");
    EXPECT_EQ(to_string(Phase::Finished), "finished");
}
