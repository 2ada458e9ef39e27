#ifndef ROLES_H_
#define ROLES_H_

#include <string>
#include <vector>

enum Team {
    GOOD,
    EVIL
};

enum Role {
    MERLIN,
    PERCIVAL,
    SERVANT,
    ASSASSIN,
    MORGANA,
    MORDRED,
    OBERON,
    MINION
};

#define NUM_ROLE_TYPES 8

// Closed set of capability flags. Visibility is derived from these alone.
struct RoleCapabilities {
    Team team;
    bool sees_evil;
    bool sees_merlin_and_morgana;
    bool is_assassin;
    bool concealed_from_merlin;
    bool appears_as_merlin;
    bool hidden_from_evil;
};

// What one seat knows about another at game start.
enum Knowledge {
    UNKNOWN,
    SELF,
    KNOWN_GOOD,
    KNOWN_EVIL,
    MERLIN_OR_MORGANA
};

typedef std::vector<std::vector<Knowledge>> VisibilityMatrix;

struct RoleConfig {
    int player_count;
    std::vector<Role> roles;
    VisibilityMatrix visibility;

    int num_good() const;
    int num_evil() const;
    int num_assassins() const;
};

const RoleCapabilities& capabilities(const Role role);
Team team_of(const Role role);

int num_evil_for(const int player_count);

RoleConfig roles_for(const int player_count);

// visibility[viewer][target] for an arbitrary seating.
VisibilityMatrix derive_visibility(const std::vector<Role>& seating);

// Throws INVALID_RULES when a custom role list breaks the catalog invariants.
void validate_role_set(const std::vector<Role>& roles, const int player_count);

std::string role_to_string(const Role role);
std::string team_to_string(const Team team);
std::string knowledge_to_string(const Knowledge knowledge);
bool role_from_string(const std::string& name, Role* role);

#endif // ROLES_H_
