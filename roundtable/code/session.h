#ifndef SESSION_H_
#define SESSION_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "decision_provider.h"
#include "errors.h"
#include "game_rules.h"
#include "game_view.h"

#define AUTO_PLAY_STEP_LIMIT 1000

struct AutoPlayResult {
    GameView view;
    bool completed;
    bool failed;
    ErrorKind error;
    std::string message;
    int steps;
};

struct GameSession;

// Owns every live game. Steps on one game are serialized; the provider is
// always called with no lock held, so different games proceed in parallel.
class SessionRegistry {
public:
    explicit SessionRegistry(bool verbose = false);
    ~SessionRegistry();

    // An empty name list gets default names.
    GameView create_game(
        const int player_count,
        const std::vector<std::string>& names,
        std::shared_ptr<DecisionProvider> provider,
        const GameRules& rules = GameRules()
    );

    // Exactly one phase transition. In TEAM_PROPOSAL the discussion and the
    // proposal are one step. A failed step leaves the game untouched.
    GameView step(const long game_id);

    // Steps until the game is over, a step fails, or `max_steps` is hit.
    // Step failures are reported in the result; only a game that no longer
    // exists throws UNKNOWN_GAME.
    AutoPlayResult auto_play(const long game_id, const int max_steps = AUTO_PLAY_STEP_LIMIT);

    GameView view(const long game_id) const;
    GameView player_view(const long game_id, const int player) const;

    void end_game(const long game_id);

    int size() const;
    std::vector<long> game_ids() const;

private:
    std::shared_ptr<GameSession> find(const long game_id) const;

    void run_proposal(GameSession* session, std::unique_lock<std::mutex>* lock);
    void run_team_vote(GameSession* session, std::unique_lock<std::mutex>* lock);
    void run_mission(GameSession* session, std::unique_lock<std::mutex>* lock);
    void run_assassination(GameSession* session, std::unique_lock<std::mutex>* lock);

    mutable std::mutex mutex_;
    std::map<long, std::shared_ptr<GameSession>> sessions_;
    long next_id_;
    bool verbose_;
};

#endif // SESSION_H_
