#include "session.h"

#include <condition_variable>
#include <iostream>
#include <random>
#include <stdexcept>

#include "game_engine.h"
#include "util.h"

struct GameSession {
    long id;
    std::unique_ptr<GameEngine> engine;
    std::shared_ptr<DecisionProvider> provider;
    std::mt19937 rng;

    std::mutex mutex;
    std::condition_variable idle;
    bool stepping;
    bool ended;
};

// Holds the session's step slot for one step. The session lock is held
// again when the slot is released.
class StepGuard {
public:
    StepGuard(GameSession* session, std::unique_lock<std::mutex>* lock) : session_(session), lock_(lock) {
        session_->stepping = true;
    }

    ~StepGuard() {
        if (!lock_->owns_lock()) {
            lock_->lock();
        }
        session_->stepping = false;
        session_->idle.notify_all();
    }

private:
    GameSession* session_;
    std::unique_lock<std::mutex>* lock_;
};

static Decision ask(DecisionProvider* provider, const DecisionRequest& request, const GameView& view) {
    Decision decision;
    try {
        decision = provider->decide(request, view);
    } catch (const GameError& e) {
        // Providers may only reject or fail; any other kind is a provider fault.
        if (e.kind() == DECISION_REJECTED || e.kind() == PROVIDER_UNAVAILABLE) {
            throw;
        }
        throw GameError(PROVIDER_UNAVAILABLE, e.reason());
    } catch (const std::exception& e) {
        throw GameError(PROVIDER_UNAVAILABLE, e.what());
    }

    if (decision.type != request.type) {
        throw GameError(
            DECISION_REJECTED,
            "player " + std::to_string(request.player) + " answered a " + decision_type_to_string(request.type) +
            " request with " + decision_type_to_string(decision.type)
        );
    }
    return decision;
}

static void reacquire(GameSession* session, std::unique_lock<std::mutex>* lock) {
    lock->lock();
    if (session->ended) {
        throw GameError(UNKNOWN_GAME, "game " + std::to_string(session->id) + " ended during a step");
    }
}

SessionRegistry::SessionRegistry(bool verbose) : next_id_(1), verbose_(verbose) {}

SessionRegistry::~SessionRegistry() {}

GameView SessionRegistry::create_game(
    const int player_count,
    const std::vector<std::string>& names,
    std::shared_ptr<DecisionProvider> provider,
    const GameRules& rules
) {
    validate_rules(rules, player_count);
    if (!provider) {
        throw std::invalid_argument("a decision provider is required");
    }

    std::vector<std::string> seat_names = (names.empty()) ? default_player_names(player_count) : names;
    if ((int) seat_names.size() != player_count) {
        throw GameError(INVALID_RULES, "expected " + std::to_string(player_count) + " names, got " + std::to_string(seat_names.size()));
    }

    auto session = std::make_shared<GameSession>();
    session->provider = std::move(provider);
    session->rng = (rules.has_seed) ? make_seeded_rng(rules.seed) : make_seeded_rng();
    session->engine = GameEngine::NewGame(seat_names, rules, &session->rng);
    session->stepping = false;
    session->ended = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->id = next_id_++;
        sessions_[session->id] = session;
    }

    if (verbose_) {
        std::cerr << "[game " << session->id << "] created with " << player_count << " players, reject limit "
                  << rules.reject_limit << std::endl;
    }
    return build_public_view(*session->engine, session->id);
}

std::shared_ptr<GameSession> SessionRegistry::find(const long game_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(game_id);
    if (it == sessions_.end()) {
        throw GameError(UNKNOWN_GAME, "no game " + std::to_string(game_id));
    }
    return it->second;
}

GameView SessionRegistry::step(const long game_id) {
    std::shared_ptr<GameSession> session = find(game_id);

    std::unique_lock<std::mutex> lock(session->mutex);
    session->idle.wait(lock, [&session] { return !session->stepping || session->ended; });
    if (session->ended) {
        throw GameError(UNKNOWN_GAME, "game " + std::to_string(game_id) + " has ended");
    }
    StepGuard guard(session.get(), &lock);

    const GameEngine& engine = *session->engine;
    const size_t seen = engine.history().size();

    switch (engine.state().phase) {
    case TEAM_PROPOSAL: {
        run_proposal(session.get(), &lock);
    } break;
    case TEAM_VOTE: {
        run_team_vote(session.get(), &lock);
    } break;
    case MISSION_VOTE: {
        run_mission(session.get(), &lock);
    } break;
    case ASSASSINATION: {
        run_assassination(session.get(), &lock);
    } break;
    case MISSION_RESULT:
    case GAME_OVER:
        break;
    }

    if (verbose_) {
        const std::vector<std::string> names = engine.names();
        for (size_t i = seen; i < engine.history().size(); i++) {
            std::cerr << "[game " << game_id << "] " << describe_event(engine.history()[i], names) << std::endl;
        }
    }
    return build_public_view(engine, game_id);
}

void SessionRegistry::run_proposal(GameSession* session, std::unique_lock<std::mutex>* lock) {
    GameEngine* engine = session->engine.get();
    const int n = engine->player_count();
    const int leader = engine->leader();
    const bool discussion = engine->rules().discussion;
    const long base_sequence = (long) engine->history().size();

    // Everyone after the leader speaks in seat order, the leader last.
    std::vector<int> speakers;
    std::vector<GameView> speaker_views;
    if (discussion) {
        for (int k = 1; k <= n; k++) {
            int speaker = (leader + k) % n;
            speakers.push_back(speaker);
            speaker_views.push_back(build_player_view(*engine, session->id, speaker));
        }
    }
    GameView leader_view = build_player_view(*engine, session->id, leader);
    lock->unlock();

    std::vector<HistoryEvent> pending;
    for (size_t i = 0; i < speakers.size(); i++) {
        GameView& view = speaker_views[i];
        view.history.insert(view.history.end(), pending.begin(), pending.end());

        DecisionRequest request = { DECIDE_SPEECH, speakers[i] };
        Decision decision = ask(session->provider.get(), request, view);

        HistoryEvent speech = HistoryEvent::Of(EVENT_SPEECH, view.state.current_round, view.state.vote_round, speakers[i]);
        speech.sequence = base_sequence + (long) pending.size();
        speech.text = decision.text;
        pending.push_back(speech);
    }

    leader_view.history.insert(leader_view.history.end(), pending.begin(), pending.end());
    DecisionRequest request = { DECIDE_TEAM_PROPOSAL, leader };
    Decision proposal = ask(session->provider.get(), request, leader_view);

    reacquire(session, lock);
    try {
        for (const HistoryEvent& speech : pending) {
            engine->check_speech(speech.actor, speech.text);
        }
        engine->check_proposal(leader, proposal.members);
    } catch (const GameError& e) {
        throw GameError(DECISION_REJECTED, e.reason());
    }

    for (const HistoryEvent& speech : pending) {
        engine->record_speech(speech.actor, speech.text);
    }
    engine->propose_team(leader, proposal.members);
}

void SessionRegistry::run_team_vote(GameSession* session, std::unique_lock<std::mutex>* lock) {
    GameEngine* engine = session->engine.get();
    const int n = engine->player_count();

    std::vector<GameView> views;
    for (int player = 0; player < n; player++) {
        views.push_back(build_player_view(*engine, session->id, player));
    }
    lock->unlock();

    std::map<int, bool> votes;
    for (int player = 0; player < n; player++) {
        DecisionRequest request = { DECIDE_VOTE, player };
        votes[player] = ask(session->provider.get(), request, views[player]).approve;
    }

    reacquire(session, lock);
    try {
        engine->check_votes(votes);
    } catch (const GameError& e) {
        throw GameError(DECISION_REJECTED, e.reason());
    }
    engine->cast_votes(votes);
}

void SessionRegistry::run_mission(GameSession* session, std::unique_lock<std::mutex>* lock) {
    GameEngine* engine = session->engine.get();
    const std::vector<int> team = engine->state().current_proposal;

    std::vector<GameView> views;
    for (int member : team) {
        views.push_back(build_player_view(*engine, session->id, member));
    }
    lock->unlock();

    std::map<int, bool> cards;
    for (size_t i = 0; i < team.size(); i++) {
        DecisionRequest request = { DECIDE_MISSION_VOTE, team[i] };
        cards[team[i]] = ask(session->provider.get(), request, views[i]).success;
    }

    reacquire(session, lock);
    try {
        engine->check_mission_votes(cards);
    } catch (const GameError& e) {
        throw GameError(DECISION_REJECTED, e.reason());
    }
    engine->cast_mission_votes(cards);
}

void SessionRegistry::run_assassination(GameSession* session, std::unique_lock<std::mutex>* lock) {
    GameEngine* engine = session->engine.get();
    const int assassin = engine->assassin();
    GameView view = build_player_view(*engine, session->id, assassin);
    lock->unlock();

    DecisionRequest request = { DECIDE_ASSASSINATION, assassin };
    Decision decision = ask(session->provider.get(), request, view);

    reacquire(session, lock);
    try {
        engine->check_assassination(assassin, decision.target);
    } catch (const GameError& e) {
        throw GameError(DECISION_REJECTED, e.reason());
    }
    engine->assassinate(assassin, decision.target);
}

AutoPlayResult SessionRegistry::auto_play(const long game_id, const int max_steps) {
    AutoPlayResult result;
    result.view = view(game_id);
    result.completed = result.view.state.game_over;
    result.failed = false;
    result.error = DECISION_REJECTED;
    result.steps = 0;

    while (!result.completed && result.steps < max_steps) {
        try {
            result.view = step(game_id);
        } catch (const GameError& e) {
            result.failed = true;
            result.error = e.kind();
            result.message = e.reason();
            if (verbose_) {
                std::cerr << "[game " << game_id << "] step failed: " << e.what() << std::endl;
            }
            if (e.kind() != UNKNOWN_GAME) {
                result.view = view(game_id);
            }
            return result;
        }
        result.steps++;
        result.completed = result.view.state.game_over;
    }

    if (!result.completed) {
        result.message = "stopped after " + std::to_string(result.steps) + " steps";
    }
    return result;
}

GameView SessionRegistry::view(const long game_id) const {
    std::shared_ptr<GameSession> session = find(game_id);
    std::lock_guard<std::mutex> lock(session->mutex);
    return build_public_view(*session->engine, game_id);
}

GameView SessionRegistry::player_view(const long game_id, const int player) const {
    std::shared_ptr<GameSession> session = find(game_id);
    std::lock_guard<std::mutex> lock(session->mutex);
    return build_player_view(*session->engine, game_id, player);
}

void SessionRegistry::end_game(const long game_id) {
    std::shared_ptr<GameSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(game_id);
        if (it == sessions_.end()) {
            throw GameError(UNKNOWN_GAME, "no game " + std::to_string(game_id));
        }
        session = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->ended = true;
    }
    session->idle.notify_all();

    if (verbose_) {
        std::cerr << "[game " << game_id << "] ended" << std::endl;
    }
}

int SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (int) sessions_.size();
}

std::vector<long> SessionRegistry::game_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<long> result;
    for (const auto& pair : sessions_) {
        result.push_back(pair.first);
    }
    return result;
}
