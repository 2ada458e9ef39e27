#ifndef BELIEF_MODEL_H_
#define BELIEF_MODEL_H_

#include <string>
#include <vector>

#include "eigen_types.h"
#include "roles.h"

enum EvidenceReason {
    MISSION_FAILED_ALL,
    MISSION_FAILED_PARTIAL,
    MISSION_SUCCEEDED,
    REJECTED_TRUSTED_TEAM,
    REJECTED_OWN_TEAM,
    APPROVED_DISTRUSTED_TEAM,
    PROPOSED_DISTRUSTED_TEAM
};

struct Evidence {
    int subject;
    double l_good;
    double l_evil;
    EvidenceReason reason;
};

struct EvidenceRecord {
    long sequence;
    Evidence evidence;
    double prior;
    double posterior;
};

std::string evidence_reason_to_string(const EvidenceReason reason);

// One agent's private trust (probability of GOOD) for every seat.
class BeliefModel {
public:
    BeliefModel(int owner, Team owner_team, const std::vector<Knowledge>& visibility, int num_evil);

    int owner() const { return owner_; }
    int size() const { return (int) trust_.size(); }

    double trust(const int subject) const { return trust_(subject); }
    bool pinned(const int subject) const { return pinned_(subject); }
    bool known_evil(const int subject) const { return subject != owner_ && pinned_(subject) && trust_(subject) <= TRUST_FLOOR; }
    int suspicious_rejections(const int subject) const { return rejections_(subject); }

    const TrustVector& trust_vector() const { return trust_; }
    const std::vector<EvidenceRecord>& log() const { return log_; }

    // All evidence of one event is combined against the pre-event trust.
    void apply(const long sequence, const std::vector<Evidence>& evidence);

    std::vector<int> most_trusted(const int count) const;
    std::vector<int> most_suspicious(const int count) const;

private:
    int owner_;
    TrustVector trust_;
    PinMask pinned_;
    CountVector rejections_;
    std::vector<EvidenceRecord> log_;
};

double clamp_trust(const double value);
double bayes_update(const double prior, const double l_good, const double l_evil);

#endif // BELIEF_MODEL_H_
