#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/election/election.h"
#include "../../src/election/leadership_guard.h"

#include <vector>

using namespace Meridian;
using ::testing::ElementsAre;

class LeadershipGuardTest : public ::testing::Test {
protected:
    LeadershipGuardTest() : election_("member-1"), guard_(&election_) {
        guard_.RegisterElectedCallback([this](uint64_t epoch) { elected_.push_back(epoch); });
        guard_.RegisterDeposedCallback([this](uint64_t epoch) { deposed_.push_back(epoch); });
    }

    LocalElection election_;
    LeadershipGuard guard_;
    std::vector<uint64_t> elected_;
    std::vector<uint64_t> deposed_;
};

TEST_F(LeadershipGuardTest, StartsAsFollower) {
    EXPECT_FALSE(guard_.IsLeader());
    EXPECT_EQ(guard_.CurrentEpoch(), 0u);
    EXPECT_FALSE(guard_.IsLeaderAt(0));
}

TEST_F(LeadershipGuardTest, ElectAndDepose) {
    uint64_t epoch = election_.Elect();
    EXPECT_TRUE(guard_.IsLeader());
    EXPECT_EQ(guard_.CurrentEpoch(), epoch);
    EXPECT_TRUE(guard_.IsLeaderAt(epoch));

    election_.Depose();
    EXPECT_FALSE(guard_.IsLeader());
    EXPECT_FALSE(guard_.IsLeaderAt(epoch));
    EXPECT_THAT(elected_, ElementsAre(epoch));
    EXPECT_THAT(deposed_, ElementsAre(epoch));
}

TEST_F(LeadershipGuardTest, ReelectionDeposesOldTermFirst) {
    uint64_t first = election_.Elect();
    uint64_t second = election_.Elect();
    EXPECT_GT(second, first);
    EXPECT_TRUE(guard_.IsLeaderAt(second));
    EXPECT_FALSE(guard_.IsLeaderAt(first));
    EXPECT_THAT(elected_, ElementsAre(first, second));
    EXPECT_THAT(deposed_, ElementsAre(first));
}

TEST_F(LeadershipGuardTest, StaleNotificationsIgnored) {
    election_.Elect();
    uint64_t current = election_.Elect();

    // A late notification of an older term changes nothing
    guard_.OnElected(current - 1);
    guard_.OnDeposed(current - 1);
    EXPECT_TRUE(guard_.IsLeaderAt(current));
    EXPECT_EQ(elected_.size(), 2u);
    EXPECT_EQ(deposed_.size(), 1u);

    // Duplicates too
    guard_.OnElected(current);
    EXPECT_EQ(elected_.size(), 2u);
}

TEST_F(LeadershipGuardTest, ResignDeposesLocallyAndInElection) {
    uint64_t epoch = election_.Elect();
    guard_.Resign("test");
    EXPECT_FALSE(guard_.IsLeader());
    EXPECT_FALSE(election_.IsLeader());
    // Deposed exactly once even though the election echoes it back
    EXPECT_THAT(deposed_, ElementsAre(epoch));

    // Resigning as a follower is a no-op
    guard_.Resign("again");
    EXPECT_EQ(deposed_.size(), 1u);
}

TEST_F(LeadershipGuardTest, ElectionResignOnlyAffectsItsEpoch) {
    uint64_t epoch = election_.Elect();
    election_.Resign(epoch + 7);
    EXPECT_TRUE(guard_.IsLeaderAt(epoch));
    election_.Resign(epoch);
    EXPECT_FALSE(guard_.IsLeader());
}

TEST_F(LeadershipGuardTest, CallbackSeesUpdatedState) {
    bool leader_in_callback = true;
    guard_.RegisterDeposedCallback([&](uint64_t) { leader_in_callback = guard_.IsLeader(); });
    election_.Elect();
    election_.Depose();
    EXPECT_FALSE(leader_in_callback);
}
