#include "evidence.h"

#include "gtest/gtest.h"
#include "test_util.h"

namespace {

class EvidenceTest : public ::testing::Test {
protected:
    EvidenceTest() : seating_(standard_seating_5()), vis_(derive_visibility(seating_)) {}

    BeliefModel observer(const int owner) const {
        return BeliefModel(owner, team_of(seating_[owner]), vis_[owner], 2);
    }

    // Merlin cannot see Mordred, so seats 1, 2 and 4 stay open.
    static BeliefModel mordred_game_observer(const int owner) {
        std::vector<Role> seating = { MERLIN, PERCIVAL, SERVANT, ASSASSIN, MORDRED };
        return BeliefModel(owner, team_of(seating[owner]), derive_visibility(seating)[owner], 2);
    }

    static HistoryEvent mission_result(const std::vector<int>& team, const int fail_count) {
        HistoryEvent event = HistoryEvent::Of(EVENT_MISSION_RESULT, 1, 0, -1);
        event.team = team;
        event.fail_count = fail_count;
        event.passed = fail_count == 0;
        return event;
    }

    static HistoryEvent vote_result(const std::vector<int>& team, const std::vector<bool>& votes) {
        HistoryEvent event = HistoryEvent::Of(EVENT_VOTE_RESULT, 1, 0, 0);
        event.team = team;
        event.votes = votes;
        return event;
    }

    static const Evidence* find(const std::vector<Evidence>& evidence, const int subject, const EvidenceReason reason) {
        for (const Evidence& e : evidence) {
            if (e.subject == subject && e.reason == reason) return &e;
        }
        return nullptr;
    }

    std::vector<Role> seating_;
    VisibilityMatrix vis_;
};

TEST_F(EvidenceTest, PartialFailImplicatesMembersProportionally) {
    BeliefModel servant = observer(2);
    std::vector<Evidence> result = project_evidence(mission_result({ 0, 1 }, 1), servant, NOT_ON_MISSION);

    ASSERT_EQ(2u, result.size());
    for (const Evidence& e : result) {
        EXPECT_EQ(MISSION_FAILED_PARTIAL, e.reason);
        EXPECT_DOUBLE_EQ(0.5, e.l_good);
        EXPECT_DOUBLE_EQ(1.0, e.l_evil);
    }

    servant.apply(0, result);
    EXPECT_NEAR(1.0 / 3.0, servant.trust(0), 1e-12);
    EXPECT_NEAR(1.0 / 3.0, servant.trust(1), 1e-12);
}

TEST_F(EvidenceTest, FullFailStronglyImplicatesEveryMember) {
    BeliefModel servant = observer(2);
    std::vector<Evidence> result = project_evidence(mission_result({ 0, 1 }, 2), servant, NOT_ON_MISSION);

    ASSERT_EQ(2u, result.size());
    EXPECT_EQ(MISSION_FAILED_ALL, result[0].reason);
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, result[0].l_good);

    servant.apply(0, result);
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, servant.trust(0));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, servant.trust(1));
}

TEST_F(EvidenceTest, ObserverDiscountsItsOwnCard) {
    // The servant played success, so the single fail belongs to the other member.
    BeliefModel servant = observer(2);
    std::vector<Evidence> result = project_evidence(mission_result({ 2, 3 }, 1), servant, VOTED_SUCCESS);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(3, result[0].subject);
    EXPECT_EQ(MISSION_FAILED_ALL, result[0].reason);

    // The assassin played the only fail, so its partner on the mission looks clean.
    BeliefModel assassin = observer(3);
    result = project_evidence(mission_result({ 1, 3 }, 1), assassin, VOTED_FAIL);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(1, result[0].subject);
    EXPECT_EQ(MISSION_SUCCEEDED, result[0].reason);
}

TEST_F(EvidenceTest, SuccessWeaklyRaisesTrust) {
    BeliefModel servant = observer(2);
    std::vector<Evidence> result = project_evidence(mission_result({ 0, 1, 3 }, 0), servant, NOT_ON_MISSION);

    ASSERT_EQ(3u, result.size());
    EXPECT_DOUBLE_EQ(1.0, result[0].l_good);
    EXPECT_DOUBLE_EQ(0.9, result[0].l_evil);

    servant.apply(0, result);
    EXPECT_NEAR(0.5 / 0.95, servant.trust(3), 1e-12);
    EXPECT_DOUBLE_EQ(0.5, servant.trust(4));
}

TEST_F(EvidenceTest, RepeatedRejectionOfTrustedTeamsEscalates) {
    // The servant trusts itself, so rejecting a team that holds it is suspicious.
    BeliefModel servant = observer(2);
    HistoryEvent event = vote_result({ 0, 2 }, { true, false, true, true, true });

    const double expected[] = { 1.15, 1.3, 1.45, 1.6, 1.6 };
    for (double l_evil : expected) {
        std::vector<Evidence> result = project_evidence(event, servant, NOT_ON_MISSION);
        const Evidence* e = find(result, 1, REJECTED_TRUSTED_TEAM);
        ASSERT_NE(nullptr, e);
        EXPECT_NEAR(l_evil, e->l_evil, 1e-12);
        servant.apply(0, result);
    }
    EXPECT_EQ(5, servant.suspicious_rejections(1));
}

TEST_F(EvidenceTest, RejectingOwnTeam) {
    BeliefModel percival = observer(1);
    std::vector<Evidence> result = project_evidence(vote_result({ 1, 2 }, { true, true, false, true, true }), percival, NOT_ON_MISSION);

    const Evidence* own = find(result, 2, REJECTED_OWN_TEAM);
    ASSERT_NE(nullptr, own);
    EXPECT_DOUBLE_EQ(1.2, own->l_evil);
    EXPECT_NE(nullptr, find(result, 2, REJECTED_TRUSTED_TEAM));
}

TEST_F(EvidenceTest, ApprovingDistrustedTeam) {
    BeliefModel merlin = mordred_game_observer(0);
    std::vector<Evidence> result = project_evidence(vote_result({ 1, 3 }, { true, true, true, true, false }), merlin, NOT_ON_MISSION);

    const Evidence* percival = find(result, 1, APPROVED_DISTRUSTED_TEAM);
    ASSERT_NE(nullptr, percival);
    EXPECT_DOUBLE_EQ(1.1, percival->l_evil);
    EXPECT_NE(nullptr, find(result, 2, APPROVED_DISTRUSTED_TEAM));
    // The known evil seat is pinned for Merlin and produces nothing.
    EXPECT_EQ(nullptr, find(result, 3, APPROVED_DISTRUSTED_TEAM));
    EXPECT_EQ(nullptr, find(result, 4, REJECTED_TRUSTED_TEAM));
}

TEST_F(EvidenceTest, ProposingDistrustedTeam) {
    BeliefModel merlin = mordred_game_observer(0);
    HistoryEvent event = HistoryEvent::Of(EVENT_TEAM_PROPOSAL, 1, 0, 1);
    event.team = { 1, 3 };

    std::vector<Evidence> result = project_evidence(event, merlin, NOT_ON_MISSION);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(1, result[0].subject);
    EXPECT_EQ(PROPOSED_DISTRUSTED_TEAM, result[0].reason);
    EXPECT_DOUBLE_EQ(1.1, result[0].l_evil);

    BeliefModel servant = observer(2);
    EXPECT_TRUE(project_evidence(event, servant, NOT_ON_MISSION).empty());
}

TEST_F(EvidenceTest, SilentEvents) {
    BeliefModel servant = observer(2);
    HistoryEvent speech = HistoryEvent::Of(EVENT_SPEECH, 1, 0, 3);
    speech.text = "I am loyal.";
    EXPECT_TRUE(project_evidence(speech, servant, NOT_ON_MISSION).empty());

    HistoryEvent assassination = HistoryEvent::Of(EVENT_ASSASSINATION, 5, 0, 3);
    assassination.target = 0;
    EXPECT_TRUE(project_evidence(assassination, servant, NOT_ON_MISSION).empty());
}

TEST_F(EvidenceTest, KnownEvilMembersAccountForFails) {
    BeliefModel merlin = mordred_game_observer(0);

    // Seat 3 is known evil and can have played the single fail.
    std::vector<Evidence> result = project_evidence(mission_result({ 3, 2 }, 1), merlin, NOT_ON_MISSION);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(2, result[0].subject);
    EXPECT_EQ(MISSION_SUCCEEDED, result[0].reason);

    // A second fail is left over for seat 2.
    result = project_evidence(mission_result({ 3, 2 }, 2), merlin, NOT_ON_MISSION);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(2, result[0].subject);
    EXPECT_EQ(MISSION_FAILED_ALL, result[0].reason);

    // Seat 4 is open to Merlin here, so it shares the blame with seat 1.
    result = project_evidence(mission_result({ 3, 1, 4 }, 2), merlin, NOT_ON_MISSION);
    ASSERT_EQ(2u, result.size());
    EXPECT_EQ(MISSION_FAILED_PARTIAL, result[0].reason);
    EXPECT_DOUBLE_EQ(0.5, result[0].l_good);
}

TEST_F(EvidenceTest, ExplainedFailsLeaveGoodSeatsAlone) {
    BeliefModel merlin = observer(0);
    ASSERT_TRUE(merlin.pinned(2));

    for (int mission = 0; mission < 2; mission++) {
        merlin.apply(mission, project_evidence(mission_result({ 3, 2 }, 1), merlin, NOT_ON_MISSION));
    }
    EXPECT_DOUBLE_EQ(TRUST_CEILING, merlin.trust(1));
    EXPECT_DOUBLE_EQ(TRUST_CEILING, merlin.trust(2));
    EXPECT_TRUE(merlin.log().empty());
}

TEST_F(EvidenceTest, SeatsLeftOverOnceEveryEvilSeatIsKnownArePinnedGood) {
    // Merlin sees both evil seats, and each evil player sees its partner.
    for (int owner : { 0, 3, 4 }) {
        BeliefModel model = observer(owner);
        for (int seat = 0; seat < 3; seat++) {
            if (seat == owner) continue;
            EXPECT_TRUE(model.pinned(seat)) << owner << " -> " << seat;
            EXPECT_DOUBLE_EQ(TRUST_CEILING, model.trust(seat)) << owner << " -> " << seat;
        }
        EXPECT_TRUE(project_evidence(vote_result({ 0, 1 }, { false, false, false, false, false }), model, NOT_ON_MISSION).empty());
    }

    // Mordred stays hidden from Merlin, so nothing is deduced.
    BeliefModel merlin = mordred_game_observer(0);
    EXPECT_FALSE(merlin.pinned(1));
    EXPECT_FALSE(merlin.pinned(4));
    EXPECT_NEAR(2.0 / 3.0, merlin.trust(4), 1e-12);
}

}  // namespace
