#include "belief_model.h"

#include <random>

#include "gtest/gtest.h"
#include "test_util.h"

namespace {

BeliefModel belief_for(const std::vector<Role>& seating, const int owner) {
    VisibilityMatrix vis = derive_visibility(seating);
    int num_evil = 0;
    for (Role role : seating) {
        if (team_of(role) == EVIL) num_evil++;
    }
    return BeliefModel(owner, team_of(seating[owner]), vis[owner], num_evil);
}

Evidence evidence(int subject, double l_good, double l_evil, EvidenceReason reason = MISSION_FAILED_PARTIAL) {
    Evidence result;
    result.subject = subject;
    result.l_good = l_good;
    result.l_evil = l_evil;
    result.reason = reason;
    return result;
}

TEST(BeliefModel, PriorsFollowVisibility) {
    BeliefModel merlin = belief_for(standard_seating_5(), 0);
    EXPECT_TRUE(merlin.pinned(0));
    EXPECT_DOUBLE_EQ(TRUST_CEILING, merlin.trust(0));
    EXPECT_TRUE(merlin.pinned(3));
    EXPECT_TRUE(merlin.pinned(4));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, merlin.trust(3));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, merlin.trust(4));
    // Merlin knows both evil seats, so everyone else must be good.
    EXPECT_TRUE(merlin.pinned(1));
    EXPECT_TRUE(merlin.pinned(2));
    EXPECT_DOUBLE_EQ(TRUST_CEILING, merlin.trust(1));

    BeliefModel servant = belief_for(standard_seating_5(), 2);
    for (int i = 0; i < 5; i++) {
        if (i == 2) continue;
        EXPECT_FALSE(servant.pinned(i));
        EXPECT_DOUBLE_EQ(0.5, servant.trust(i));
    }

    BeliefModel percival = belief_for(standard_seating_5(), 1);
    EXPECT_DOUBLE_EQ(0.5, percival.trust(0));
    EXPECT_DOUBLE_EQ(0.5, percival.trust(4));
    EXPECT_DOUBLE_EQ(0.5, percival.trust(2));

    BeliefModel assassin = belief_for(standard_seating_5(), 3);
    EXPECT_TRUE(assassin.pinned(3));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, assassin.trust(3));
    EXPECT_TRUE(assassin.pinned(4));
    EXPECT_TRUE(assassin.pinned(0));
    EXPECT_DOUBLE_EQ(TRUST_CEILING, assassin.trust(0));
}

TEST(BeliefModel, BayesUpdate) {
    EXPECT_NEAR(1.0 / 3.0, bayes_update(0.5, 0.5, 1.0), 1e-12);
    EXPECT_NEAR(0.5 / 0.95, bayes_update(0.5, 1.0, 0.9), 1e-12);
    EXPECT_DOUBLE_EQ(0.4, bayes_update(0.4, 0.0, 0.0));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, clamp_trust(0.0));
    EXPECT_DOUBLE_EQ(TRUST_CEILING, clamp_trust(1.0));
}

TEST(BeliefModel, ApplyClampsAndLogs) {
    BeliefModel servant = belief_for(standard_seating_5(), 2);
    servant.apply(7, { evidence(0, TRUST_FLOOR, 1.0, MISSION_FAILED_ALL) });

    EXPECT_DOUBLE_EQ(TRUST_FLOOR, servant.trust(0));
    ASSERT_EQ(1u, servant.log().size());
    EXPECT_EQ(7, servant.log()[0].sequence);
    EXPECT_DOUBLE_EQ(0.5, servant.log()[0].prior);
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, servant.log()[0].posterior);
}

TEST(BeliefModel, PinnedAndOwnerAreNeverUpdated) {
    BeliefModel merlin = belief_for(standard_seating_5(), 0);
    merlin.apply(1, {
        evidence(0, 0.01, 1.0),
        evidence(3, 1.0, 0.01),
        evidence(4, 1.0, 0.01),
    });

    EXPECT_DOUBLE_EQ(TRUST_CEILING, merlin.trust(0));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, merlin.trust(3));
    EXPECT_DOUBLE_EQ(TRUST_FLOOR, merlin.trust(4));
    EXPECT_TRUE(merlin.log().empty());
}

TEST(BeliefModel, EvidenceWithinOneEventIsOrderIndependent) {
    BeliefModel a = belief_for(standard_seating_5(), 2);
    BeliefModel b = belief_for(standard_seating_5(), 2);

    a.apply(1, { evidence(0, 0.5, 1.0), evidence(0, 1.0, 1.2), evidence(1, 1.0, 0.9) });
    b.apply(1, { evidence(1, 1.0, 0.9), evidence(0, 1.0, 1.2), evidence(0, 0.5, 1.0) });

    for (int i = 0; i < 5; i++) {
        EXPECT_DOUBLE_EQ(a.trust(i), b.trust(i));
    }
}

TEST(BeliefModel, StaysWithinBoundsUnderRandomEvidence) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<> subject(0, 4);
    std::uniform_real_distribution<> likelihood(0.001, 3.0);

    for (int owner = 0; owner < 5; owner++) {
        BeliefModel model = belief_for(standard_seating_5(), owner);
        TrustVector initial = model.trust_vector();

        for (long event = 0; event < 5000; event++) {
            std::vector<Evidence> batch;
            for (int k = 0; k < 3; k++) {
                batch.push_back(evidence(subject(rng), likelihood(rng), likelihood(rng)));
            }
            model.apply(event, batch);

            for (int i = 0; i < 5; i++) {
                ASSERT_GE(model.trust(i), TRUST_FLOOR);
                ASSERT_LE(model.trust(i), TRUST_CEILING);
            }
        }

        for (int i = 0; i < 5; i++) {
            if (model.pinned(i)) {
                EXPECT_DOUBLE_EQ(initial(i), model.trust(i));
            }
        }
    }
}

TEST(BeliefModel, RankingQueries) {
    BeliefModel servant = belief_for(standard_seating_5(), 2);
    servant.apply(1, { evidence(3, 0.2, 1.0), evidence(4, 0.6, 1.0), evidence(1, 1.0, 0.5) });

    std::vector<int> trusted = servant.most_trusted(2);
    ASSERT_EQ(2u, trusted.size());
    EXPECT_EQ(1, trusted[0]);
    EXPECT_EQ(0, trusted[1]);

    std::vector<int> suspicious = servant.most_suspicious(1);
    ASSERT_EQ(1u, suspicious.size());
    EXPECT_EQ(3, suspicious[0]);

    EXPECT_EQ(4u, servant.most_trusted(10).size());
}

TEST(BeliefModel, CountsSuspiciousRejections) {
    BeliefModel servant = belief_for(standard_seating_5(), 2);
    servant.apply(1, { evidence(3, 1.0, 1.15, REJECTED_TRUSTED_TEAM) });
    servant.apply(2, { evidence(3, 1.0, 1.3, REJECTED_TRUSTED_TEAM), evidence(4, 1.0, 1.2, REJECTED_OWN_TEAM) });

    EXPECT_EQ(2, servant.suspicious_rejections(3));
    EXPECT_EQ(0, servant.suspicious_rejections(4));
    EXPECT_EQ("REJECTED_TRUSTED_TEAM", evidence_reason_to_string(servant.log()[0].evidence.reason));
}

}  // namespace
