#include "belief_model.h"

#include <algorithm>
#include <cmath>

std::string evidence_reason_to_string(const EvidenceReason reason) {
    switch (reason) {
    case MISSION_FAILED_ALL:
        return "MISSION_FAILED_ALL";
    case MISSION_FAILED_PARTIAL:
        return "MISSION_FAILED_PARTIAL";
    case MISSION_SUCCEEDED:
        return "MISSION_SUCCEEDED";
    case REJECTED_TRUSTED_TEAM:
        return "REJECTED_TRUSTED_TEAM";
    case REJECTED_OWN_TEAM:
        return "REJECTED_OWN_TEAM";
    case APPROVED_DISTRUSTED_TEAM:
        return "APPROVED_DISTRUSTED_TEAM";
    case PROPOSED_DISTRUSTED_TEAM:
        return "PROPOSED_DISTRUSTED_TEAM";
    }
    return "?????";
}

double clamp_trust(const double value) {
    return std::min(TRUST_CEILING, std::max(TRUST_FLOOR, value));
}

double bayes_update(const double prior, const double l_good, const double l_evil) {
    double good = prior * l_good;
    double evil = (1.0 - prior) * l_evil;
    double sum = good + evil;
    if (!std::isfinite(sum) || sum <= 0.0) {
        return prior;
    }
    return good / sum;
}

BeliefModel::BeliefModel(int owner, Team owner_team, const std::vector<Knowledge>& visibility, int num_evil) :
    owner_(owner) {
    const int n = (int) visibility.size();
    trust_ = TrustVector::Constant(n, TRUST_PRIOR);
    pinned_ = PinMask::Constant(n, false);
    rejections_ = CountVector::Zero(n);

    int known_evil = 0;
    int pair_size = 0;
    int unknown = 0;
    for (Knowledge knowledge : visibility) {
        switch (knowledge) {
        case KNOWN_EVIL: known_evil++; break;
        case MERLIN_OR_MORGANA: pair_size++; break;
        case UNKNOWN: unknown++; break;
        default: break;
        }
    }

    // The Merlin/Morgana pair always holds exactly one evil seat.
    int remaining_evil = num_evil - known_evil - ((owner_team == EVIL) ? 1 : 0) - ((pair_size > 0) ? 1 : 0);
    remaining_evil = std::max(0, remaining_evil);
    double unknown_prior = (unknown > 0) ? (1.0 - (double) remaining_evil / unknown) : TRUST_PRIOR;
    double pair_prior = (pair_size > 0) ? (1.0 - 1.0 / pair_size) : TRUST_PRIOR;

    for (int i = 0; i < n; i++) {
        switch (visibility[i]) {
        case SELF: {
            trust_(i) = (owner_team == GOOD) ? TRUST_CEILING : TRUST_FLOOR;
            pinned_(i) = true;
        } break;
        case KNOWN_GOOD: {
            trust_(i) = TRUST_CEILING;
            pinned_(i) = true;
        } break;
        case KNOWN_EVIL: {
            trust_(i) = TRUST_FLOOR;
            pinned_(i) = true;
        } break;
        case MERLIN_OR_MORGANA: {
            trust_(i) = clamp_trust(pair_prior);
        } break;
        case UNKNOWN: {
            // With every evil seat accounted for, the rest are known good.
            trust_(i) = (remaining_evil == 0) ? TRUST_CEILING : clamp_trust(unknown_prior);
            pinned_(i) = (remaining_evil == 0);
        } break;
        }
    }
}

void BeliefModel::apply(const long sequence, const std::vector<Evidence>& evidence) {
    if (evidence.empty()) {
        return;
    }

    const int n = size();
    TrustVector l_good = TrustVector::Ones(n);
    TrustVector l_evil = TrustVector::Ones(n);
    PinMask touched = PinMask::Constant(n, false);

    for (const Evidence& e : evidence) {
        if (e.subject < 0 || e.subject >= n || e.subject == owner_ || pinned_(e.subject)) continue;
        l_good(e.subject) *= e.l_good;
        l_evil(e.subject) *= e.l_evil;
        touched(e.subject) = true;
        if (e.reason == REJECTED_TRUSTED_TEAM) {
            rejections_(e.subject)++;
        }
    }

    TrustVector prior = trust_;
    for (int subject = 0; subject < n; subject++) {
        if (!touched(subject)) continue;
        trust_(subject) = clamp_trust(bayes_update(prior(subject), l_good(subject), l_evil(subject)));
    }

    for (const Evidence& e : evidence) {
        if (e.subject < 0 || e.subject >= n || !touched(e.subject)) continue;
        EvidenceRecord record;
        record.sequence = sequence;
        record.evidence = e;
        record.prior = prior(e.subject);
        record.posterior = trust_(e.subject);
        log_.push_back(record);
    }
}

std::vector<int> BeliefModel::most_trusted(const int count) const {
    std::vector<int> others;
    for (int i = 0; i < size(); i++) {
        if (i != owner_) others.push_back(i);
    }
    std::stable_sort(others.begin(), others.end(), [this](int a, int b) { return trust_(a) > trust_(b); });
    if ((int) others.size() > count) {
        others.resize(std::max(0, count));
    }
    return others;
}

std::vector<int> BeliefModel::most_suspicious(const int count) const {
    std::vector<int> others;
    for (int i = 0; i < size(); i++) {
        if (i != owner_) others.push_back(i);
    }
    std::stable_sort(others.begin(), others.end(), [this](int a, int b) { return trust_(a) < trust_(b); });
    if ((int) others.size() > count) {
        others.resize(std::max(0, count));
    }
    return others;
}
