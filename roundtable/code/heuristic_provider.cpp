#include "heuristic_provider.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "evidence.h"
#include "util.h"

HeuristicProvider::HeuristicProvider(unsigned int seed) : rng_(seed) {}

HeuristicProvider::HeuristicProvider() : rng_(make_seeded_rng()) {}

std::vector<int> rank_by_trust(const GameView& view, const bool skip_known_evil) {
    std::vector<int> result;
    for (const SeatView& seat : view.seats) {
        if (seat.id == view.viewer) continue;
        if (skip_known_evil && seat.knowledge == KNOWN_EVIL) continue;
        result.push_back(seat.id);
    }

    std::stable_sort(result.begin(), result.end(), [&view](int a, int b) {
        return view.beliefs(a) > view.beliefs(b);
    });
    return result;
}

static bool on_team(const std::vector<int>& team, const int player) {
    return std::find(team.begin(), team.end(), player) != team.end();
}

static bool known_evil(const GameView& view, const int player) {
    return view.seats[player].knowledge == KNOWN_EVIL;
}

bool HeuristicProvider::coin(const double probability) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dis(0.0, 1.0);
    return dis(rng_) < probability;
}

Decision HeuristicProvider::decide(const DecisionRequest& request, const GameView& view) {
    if (view.viewer != request.player) {
        throw std::invalid_argument("view belongs to player " + std::to_string(view.viewer) + ", not " + std::to_string(request.player));
    }

    switch (request.type) {
    case DECIDE_TEAM_PROPOSAL: return propose(view);
    case DECIDE_VOTE: return vote(view);
    case DECIDE_MISSION_VOTE: return mission_vote(view);
    case DECIDE_ASSASSINATION: return assassinate(view);
    case DECIDE_SPEECH: return speak(view);
    }
    throw std::invalid_argument("unhandled decision type");
}

Decision HeuristicProvider::propose(const GameView& view) {
    const int team_size = view.mission.team_size;

    // Self first, then the most trusted seats; evil players keep their
    // partners off so a single fail does not expose both.
    std::vector<int> team = { view.viewer };
    for (int candidate : rank_by_trust(view, true)) {
        if ((int) team.size() >= team_size) break;
        team.push_back(candidate);
    }
    for (int candidate : rank_by_trust(view, false)) {
        if ((int) team.size() >= team_size) break;
        if (!on_team(team, candidate)) team.push_back(candidate);
    }

    team.resize(team_size);
    return Decision::TeamProposal(team);
}

Decision HeuristicProvider::vote(const GameView& view) {
    const GameState& state = view.state;
    const std::vector<int>& team = state.current_proposal;
    const int last_chance = view.reject_limit - 1;

    if (view.my_team == EVIL) {
        if (state.failed_missions >= MISSIONS_TO_WIN - 1) return Decision::Vote(true);
        if (on_team(team, view.viewer)) return Decision::Vote(true);
        bool all_trusted = true;
        for (int member : team) {
            if (known_evil(view, member)) return Decision::Vote(true);
            if (view.beliefs(member) < TRUSTED_THRESHOLD) all_trusted = false;
        }
        return Decision::Vote(!all_trusted);
    }

    if (state.vote_round >= last_chance) {
        return Decision::Vote(true);
    }

    bool suspicious = false;
    for (int member : team) {
        if (member == view.viewer) continue;
        if (known_evil(view, member) || view.beliefs(member) <= DISTRUSTED_THRESHOLD) {
            suspicious = true;
        }
    }
    if (!suspicious) {
        return Decision::Vote(true);
    }

    if (state.vote_round >= last_chance - 1) {
        // One rejection away from a stalemate.
        return Decision::Vote(coin((view.my_role == MERLIN) ? 0.3 : 0.6));
    }
    return Decision::Vote(false);
}

Decision HeuristicProvider::mission_vote(const GameView& view) {
    if (view.my_team == GOOD) {
        return Decision::MissionVote(true);
    }

    if (view.mission.fails_required > 1) {
        return Decision::MissionVote(false);
    }

    // Only the lowest seated evil member on the team fails.
    for (int member : view.state.current_proposal) {
        if (member < view.viewer && known_evil(view, member)) {
            return Decision::MissionVote(true);
        }
    }
    return Decision::MissionVote(false);
}

Decision HeuristicProvider::assassinate(const GameView& view) {
    std::vector<int> candidates = rank_by_trust(view, true);
    if (candidates.empty()) {
        throw std::runtime_error("no target available to player " + std::to_string(view.viewer));
    }
    return Decision::Assassination(candidates.front());
}

Decision HeuristicProvider::speak(const GameView& view) {
    const std::vector<int> ranked = rank_by_trust(view, view.my_team == EVIL);
    const std::string& trusted = view.seats[ranked.front()].name;
    const std::string& suspect = view.seats[ranked.back()].name;

    std::stringstream speech;
    speech << "Round " << view.state.current_round << ": ";
    if (view.my_team == EVIL) {
        speech << "something about how " << trusted << " has been voting does not add up to me.";
    } else if (view.beliefs(ranked.back()) < TRUST_PRIOR) {
        speech << "I trust " << trusted << ". I have doubts about " << suspect << ".";
    } else {
        speech << "I trust " << trusted << " and would like to see them on the mission.";
    }
    return Decision::Speech(speech.str());
}
