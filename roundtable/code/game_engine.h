#ifndef GAME_ENGINE_H_
#define GAME_ENGINE_H_

#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "belief_model.h"
#include "evidence.h"
#include "game_rules.h"
#include "game_state.h"
#include "history.h"
#include "mission_rules.h"

// Authoritative state machine for one game. Every mutating call validates
// first and throws GameError without touching the state on failure.
// Not synchronized; SessionRegistry serializes access.
class GameEngine {
public:
    GameEngine(const std::vector<std::string>& names, const std::vector<Role>& seating, const GameRules& rules);

    // Seats the catalog (or rules) roles in random order.
    static std::unique_ptr<GameEngine> NewGame(const std::vector<std::string>& names, const GameRules& rules, std::mt19937* rng);

    int player_count() const { return (int) players_.size(); }
    const GameState& state() const { return state_; }
    const GameRules& rules() const { return rules_; }
    const std::vector<Player>& players() const { return players_; }
    const std::vector<HistoryEvent>& history() const { return history_; }
    const BeliefModel& belief(const int player) const { return beliefs_.at(player); }
    const MissionTable& missions() const { return missions_; }
    std::vector<std::string> names() const;

    MissionConfig current_mission() const;
    int leader() const { return state_.leader_index; }
    // -1 when no assassin is seated.
    int assassin() const;

    void check_proposal(const int leader, const std::vector<int>& members) const;
    void check_votes(const std::map<int, bool>& votes) const;
    void check_mission_votes(const std::map<int, bool>& success_by_member) const;
    void check_assassination(const int assassin, const int target) const;
    void check_speech(const int speaker, const std::string& text) const;

    void propose_team(const int leader, const std::vector<int>& members);
    void cast_votes(const std::map<int, bool>& votes);
    void cast_mission_votes(const std::map<int, bool>& success_by_member);
    void assassinate(const int assassin, const int target);
    void record_speech(const int speaker, const std::string& text);

private:
    void emit(HistoryEvent event, const std::map<int, bool>* mission_votes);
    void finish(const Team winner, const EndReason reason);
    void advance_round();
    void advance_leader();

    GameRules rules_;
    MissionTable missions_;
    std::vector<Player> players_;
    std::vector<BeliefModel> beliefs_;
    std::vector<HistoryEvent> history_;
    GameState state_;
    long next_sequence_;
};

#endif // GAME_ENGINE_H_
