#include "decision_provider.h"

#include "errors.h"
#include "serialization.h"

Decision JsonReplyProvider::decide(const DecisionRequest& request, const GameView& view) {
    const std::string view_json = view_to_json(view).dump();

    std::string reply;
    try {
        reply = source_->reply(request, view_json);
    } catch (const GameError&) {
        throw;
    } catch (const std::exception& e) {
        throw GameError(PROVIDER_UNAVAILABLE, e.what());
    }

    return parse_decision(reply, request, view.player_count);
}
