#ifndef HEURISTIC_PROVIDER_H_
#define HEURISTIC_PROVIDER_H_

#include <mutex>
#include <random>
#include <vector>

#include "decision_provider.h"

// Rule-based player. Works only from the player view it is handed.
class HeuristicProvider : public DecisionProvider {
public:
    explicit HeuristicProvider(unsigned int seed);
    HeuristicProvider();

    Decision decide(const DecisionRequest& request, const GameView& view) override;

private:
    Decision propose(const GameView& view);
    Decision vote(const GameView& view);
    Decision mission_vote(const GameView& view);
    Decision assassinate(const GameView& view);
    Decision speak(const GameView& view);

    bool coin(const double probability);

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// Other seats ordered by descending trust, ties by seat id. Known evil
// partners are left out when `skip_known_evil` is set.
std::vector<int> rank_by_trust(const GameView& view, const bool skip_known_evil);

#endif // HEURISTIC_PROVIDER_H_
