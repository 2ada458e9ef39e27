#include "roles.h"

#include <map>

#include "errors.h"
#include "lookup_tables.h"

static bool supported_count(const int player_count) {
    return player_count >= MIN_PLAYERS && player_count <= MAX_PLAYERS;
}

int RoleConfig::num_good() const {
    int count = 0;
    for (Role role : roles) {
        if (team_of(role) == GOOD) count++;
    }
    return count;
}

int RoleConfig::num_evil() const {
    return (int) roles.size() - num_good();
}

int RoleConfig::num_assassins() const {
    int count = 0;
    for (Role role : roles) {
        if (capabilities(role).is_assassin) count++;
    }
    return count;
}

const RoleCapabilities& capabilities(const Role role) {
    return ROLE_CAPABILITIES[role];
}

Team team_of(const Role role) {
    return ROLE_CAPABILITIES[role].team;
}

int num_evil_for(const int player_count) {
    if (!supported_count(player_count)) {
        throw GameError(UNSUPPORTED_PLAYER_COUNT, "no role table for " + std::to_string(player_count) + " players");
    }
    return PLAYERS_TO_NUM_EVIL[player_count - MIN_PLAYERS];
}

RoleConfig roles_for(const int player_count) {
    if (!supported_count(player_count)) {
        throw GameError(UNSUPPORTED_PLAYER_COUNT, "no role table for " + std::to_string(player_count) + " players");
    }

    RoleConfig result;
    result.player_count = player_count;
    const Role* standard = (player_count == 5) ? STANDARD_ROLES_5 : STANDARD_ROLES_6;
    result.roles.assign(standard, standard + player_count);
    result.visibility = derive_visibility(result.roles);
    return result;
}

static Knowledge knowledge_of(const std::vector<Role>& seating, const int viewer, const int target, const int num_merlin_candidates) {
    if (viewer == target) {
        return SELF;
    }

    const RoleCapabilities& me = capabilities(seating[viewer]);
    const RoleCapabilities& them = capabilities(seating[target]);

    if (me.sees_evil && them.team == EVIL) {
        if (me.team == GOOD && !them.concealed_from_merlin) {
            return KNOWN_EVIL;
        }
        if (me.team == EVIL && !them.hidden_from_evil) {
            return KNOWN_EVIL;
        }
    }

    if (me.sees_merlin_and_morgana && them.appears_as_merlin) {
        if (num_merlin_candidates > 1) {
            return MERLIN_OR_MORGANA;
        }
        // Only one of the pair is in play, so there is nothing to confuse it with.
        return (them.team == GOOD) ? KNOWN_GOOD : KNOWN_EVIL;
    }

    return UNKNOWN;
}

VisibilityMatrix derive_visibility(const std::vector<Role>& seating) {
    const int n = (int) seating.size();

    int num_merlin_candidates = 0;
    for (Role role : seating) {
        if (capabilities(role).appears_as_merlin) num_merlin_candidates++;
    }

    VisibilityMatrix result(n, std::vector<Knowledge>(n, UNKNOWN));
    for (int viewer = 0; viewer < n; viewer++) {
        for (int target = 0; target < n; target++) {
            result[viewer][target] = knowledge_of(seating, viewer, target, num_merlin_candidates);
        }
    }
    return result;
}

void validate_role_set(const std::vector<Role>& roles, const int player_count) {
    if ((int) roles.size() != player_count) {
        throw GameError(INVALID_RULES, "role list has " + std::to_string(roles.size()) + " roles for " + std::to_string(player_count) + " players");
    }

    RoleConfig config;
    config.player_count = player_count;
    config.roles = roles;

    if (config.num_evil() != num_evil_for(player_count)) {
        throw GameError(INVALID_RULES, "role list has " + std::to_string(config.num_evil()) + " evil roles, expected " + std::to_string(num_evil_for(player_count)));
    }
    if (config.num_assassins() > 1) {
        throw GameError(INVALID_RULES, "at most one assassin may be configured");
    }

    int merlins = 0;
    for (Role role : roles) {
        if (role == MERLIN) merlins++;
    }
    if (merlins > 1) {
        throw GameError(INVALID_RULES, "at most one merlin may be configured");
    }
}

std::string role_to_string(const Role role) {
    switch (role) {
    case MERLIN:
        return "MERLIN";
    case PERCIVAL:
        return "PERCIVAL";
    case SERVANT:
        return "SERVANT";
    case ASSASSIN:
        return "ASSASSIN";
    case MORGANA:
        return "MORGANA";
    case MORDRED:
        return "MORDRED";
    case OBERON:
        return "OBERON";
    case MINION:
        return "MINION";
    }
    return "?????";
}

std::string team_to_string(const Team team) {
    return (team == GOOD) ? "GOOD" : "EVIL";
}

std::string knowledge_to_string(const Knowledge knowledge) {
    switch (knowledge) {
    case UNKNOWN:
        return "UNKNOWN";
    case SELF:
        return "SELF";
    case KNOWN_GOOD:
        return "KNOWN_GOOD";
    case KNOWN_EVIL:
        return "KNOWN_EVIL";
    case MERLIN_OR_MORGANA:
        return "MERLIN_OR_MORGANA";
    }
    return "?????";
}

bool role_from_string(const std::string& name, Role* role) {
    static const std::map<std::string, Role> lookup = {
        { "MERLIN", MERLIN },
        { "PERCIVAL", PERCIVAL },
        { "SERVANT", SERVANT },
        { "ASSASSIN", ASSASSIN },
        { "MORGANA", MORGANA },
        { "MORDRED", MORDRED },
        { "OBERON", OBERON },
        { "MINION", MINION },
    };

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        return false;
    }
    *role = it->second;
    return true;
}
