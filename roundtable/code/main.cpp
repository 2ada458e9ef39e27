#include <iostream>
#include <vector>
#include <string>
#include <fstream>
#include <algorithm>
#include <memory>
#include "optionparser.h"
#include "errors.h"
#include "heuristic_provider.h"
#include "serialization.h"
#include "session.h"
#include "util.h"

using namespace std;

enum optionIndex {
    UNKNOWN_OPTION,
    HELP,
    NUM_PLAYERS,
    PLAYER_NAMES,
    NUM_GAMES,
    SEED,
    RULES_FILE,
    STEP_MODE,
    JSON_OUTPUT,
    VERBOSE,
};

const option::Descriptor usage[] = {
    { UNKNOWN_OPTION, 0,   "",              "",        option::Arg::None,       "USAGE: roundtable [options]\n\nOptions:"},
    { HELP,           0,   "h",         "help",        option::Arg::None,       "  \t-h, --help  \tPrint usage and exit." },
    { NUM_PLAYERS,    0,   "p",      "players",    option::Arg::Optional,       "  \t-p<num>, --players=<num>  \tNumber of players, 5 or 6 (default: 5)" },
    { PLAYER_NAMES,   0,   "n",        "names",    option::Arg::Optional,       "  \t-n<list>, --names=<list>  \tComma separated player names (default: Player 1..n)" },
    { NUM_GAMES,      0,   "g",        "games",    option::Arg::Optional,       "  \t-g<num>, --games=<num>  \tNumber of games to play (default: 1)" },
    { SEED,           0,   "s",         "seed",    option::Arg::Optional,       "  \t-s<num>, --seed=<num>  \tSeed for role shuffling and the heuristic players (default: random)" },
    { RULES_FILE,     0,   "r",        "rules",    option::Arg::Optional,       "  \t-r<file>, --rules=<file>  \tJSON rules file (default: standard rules)" },
    { STEP_MODE,      0,   "t",         "step",    option::Arg::None,           "  \t-t, --step  \tPrint the public view after every step" },
    { JSON_OUTPUT,    0,   "j",         "json",    option::Arg::None,           "  \t-j, --json  \tPrint the final public view of every game as JSON" },
    { VERBOSE,        0,   "v",      "verbose",    option::Arg::None,           "  \t-v, --verbose  \tLog every game event to stderr" },
    { 0, 0, 0, 0, 0, 0 }
};

// A bare "-p" with no value parses as an empty setting.
static std::string option_value(const option::Option& opt) {
    const char* arg = opt.last()->arg;
    return (arg == nullptr) ? std::string() : std::string(arg);
}

void print_banner(const int num_players, const int num_games, const GameRules& rules, const std::string& rules_file) {
    cerr << "================ ROUNDTABLE AVALON =================" << endl;
    cerr << "              # Players: " << num_players << endl;
    cerr << "                # Games: " << num_games << endl;
    cerr << "                   Seed: " << ((rules.has_seed) ? std::to_string(rules.seed) : "random") << endl;
    cerr << "------------------ Game settings -------------------" << endl;
    cerr << "           Reject limit: " << rules.reject_limit << endl;
    cerr << "       Stalemate winner: " << team_to_string(rules.stalemate_winner) << endl;
    cerr << "             Discussion: " << ((rules.discussion) ? "on" : "off") << endl;
    cerr << "          Shuffle roles: " << ((rules.shuffle_roles) ? "on" : "off") << endl;
    cerr << "                  Roles: " << ((rules.roles.empty()) ? "standard" : "custom") << endl;
    cerr << "               Missions: " << ((rules.missions.empty()) ? "standard" : "custom") << endl;
    cerr << "             Rules file: " << ((rules_file.empty()) ? "(none)" : "'" + rules_file + "'") << endl;
    cerr << "====================================================" << endl;
}

AutoPlayResult play_stepwise(SessionRegistry* registry, const long game_id) {
    AutoPlayResult result;
    result.view = registry->view(game_id);
    result.completed = false;
    result.failed = false;
    result.error = DECISION_REJECTED;
    result.steps = 0;

    json_serialize_view(result.view, std::cout);
    while (!result.view.state.game_over && result.steps < AUTO_PLAY_STEP_LIMIT) {
        try {
            result.view = registry->step(game_id);
        } catch (const GameError& e) {
            result.failed = true;
            result.error = e.kind();
            result.message = e.reason();
            return result;
        }
        result.steps++;
        json_serialize_view(result.view, std::cout);
    }
    result.completed = result.view.state.game_over;
    return result;
}

int play_games(
    const int num_players,
    const std::vector<std::string>& names,
    const int num_games,
    const GameRules& rules,
    const bool step_mode,
    const bool json_output,
    const bool verbose
) {
    SessionRegistry registry(verbose);
    int good_wins = 0;
    int evil_wins = 0;
    int failures = 0;

    const int status_interval = max(1, min(100, num_games/10));

    for (int i = 0; i < num_games; i++) {
        if (num_games > 1 && i % status_interval == 0) {
            cerr << i << "/" << num_games << endl;
        }

        GameRules game_rules = rules;
        std::shared_ptr<HeuristicProvider> provider;
        if (rules.has_seed) {
            game_rules.seed = rules.seed + i;
            provider = std::make_shared<HeuristicProvider>(game_rules.seed);
        } else {
            provider = std::make_shared<HeuristicProvider>();
        }

        long game_id = registry.create_game(num_players, names, provider, game_rules).game_id;
        AutoPlayResult result = (step_mode) ? play_stepwise(&registry, game_id) : registry.auto_play(game_id);
        registry.end_game(game_id);

        if (result.failed) {
            failures++;
            cerr << "Game " << game_id << " failed: " << error_kind_to_string(result.error) << ": " << result.message << endl;
            continue;
        }

        const GameState& state = result.view.state;
        if (state.has_winner && state.winner == GOOD) good_wins++;
        if (state.has_winner && state.winner == EVIL) evil_wins++;

        if (json_output && !step_mode) {
            json_serialize_view(result.view, std::cout);
        } else if (!step_mode) {
            cout << "Game " << game_id << ": "
                 << ((state.has_winner) ? team_to_string(state.winner) + " wins" : "unfinished")
                 << " (" << end_reason_to_string(state.end_reason) << ") after " << result.steps << " steps" << endl;
        }
    }

    cerr << "------------------- Results ------------------------" << endl;
    cerr << "              GOOD wins: " << good_wins << endl;
    cerr << "              EVIL wins: " << evil_wins << endl;
    cerr << "               Failures: " << failures << endl;
    return (failures > 0) ? 1 : 0;
}

int main(int argc, char* argv[]) {
    argc -= (argc > 0); argv += (argc > 0); // skip program name argv[0] if present

    option::Stats stats(usage, argc, argv);
    std::vector<option::Option> options(stats.options_max);
    std::vector<option::Option> buffer(stats.buffer_max);
    option::Parser parse(usage, argc, argv, &options[0], &buffer[0]);
    if (parse.error())
        return 1;

    if (options[HELP]) {
        option::printUsage(std::cout, usage);
        return 0;
    }

    std::string s_num_players;
    std::string s_names;
    std::string s_num_games;
    std::string s_seed;
    std::string rules_file;
    if (options[NUM_PLAYERS]) s_num_players = option_value(options[NUM_PLAYERS]);
    if (options[PLAYER_NAMES]) s_names = option_value(options[PLAYER_NAMES]);
    if (options[NUM_GAMES]) s_num_games = option_value(options[NUM_GAMES]);
    if (options[SEED]) s_seed = option_value(options[SEED]);
    if (options[RULES_FILE]) rules_file = option_value(options[RULES_FILE]);

    try {
        int num_players = (s_num_players.empty()) ? MIN_PLAYERS : std::stoi(s_num_players);
        int num_games = (s_num_games.empty()) ? 1 : std::stoi(s_num_games);
        std::vector<std::string> names = split_names(s_names);

        GameRules rules;
        if (!rules_file.empty()) {
            std::ifstream fs(rules_file);
            if (!fs) {
                std::cerr << "Could not open rules file '" << rules_file << "'" << std::endl;
                return 1;
            }
            json_deserialize_rules(fs, &rules);
        }
        if (!s_seed.empty()) {
            rules.seed = (unsigned int) std::stoul(s_seed);
            rules.has_seed = true;
        }
        validate_rules(rules, num_players);

        print_banner(num_players, num_games, rules, rules_file);
        return play_games(num_players, names, num_games, rules, options[STEP_MODE], options[JSON_OUTPUT], options[VERBOSE]);
    } catch (const GameError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::logic_error& e) {
        std::cerr << "Bad argument: " << e.what() << std::endl;
        return 1;
    }
}
