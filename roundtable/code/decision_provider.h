#ifndef DECISION_PROVIDER_H_
#define DECISION_PROVIDER_H_

#include <memory>
#include <string>

#include "decisions.h"
#include "game_view.h"

// Source of player decisions. May block; it is always called with no
// session lock held. Throw GameError(PROVIDER_UNAVAILABLE) on transport
// failure.
class DecisionProvider {
public:
    virtual ~DecisionProvider() {}

    virtual Decision decide(const DecisionRequest& request, const GameView& view) = 0;
};

// Raw text channel to a remote completion service.
class ReplySource {
public:
    virtual ~ReplySource() {}

    virtual std::string reply(const DecisionRequest& request, const std::string& view_json) = 0;
};

// Sends the player's view as JSON and parses the reply strictly.
class JsonReplyProvider : public DecisionProvider {
public:
    explicit JsonReplyProvider(std::shared_ptr<ReplySource> source) : source_(std::move(source)) {}

    Decision decide(const DecisionRequest& request, const GameView& view) override;

private:
    std::shared_ptr<ReplySource> source_;
};

#endif // DECISION_PROVIDER_H_
