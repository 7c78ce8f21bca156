#pragma once

#include "quest_engine.h"
#include "spirit_registry.h"

#include <deque>
#include <optional>
#include <string>
#include <vector>

class CueBus;

enum class DialogueState
{
    Closed,
    Presenting,
    ChoicePending,
    ChallengeActive
};

const char *DialogueStateLabel(DialogueState state);

enum class ChoiceKind
{
    BeginChallenge,
    KeepCompany,
    BackAway,
    Okay,
    Acknowledge,
    Companion,
    ThankThem,
    LeaveQuietly
};

struct DialogueChoice
{
    ChoiceKind kind = ChoiceKind::BackAway;
    std::string label;
};

struct DialogueSession
{
    std::string objectId;
    std::deque<std::string> pending;
    std::string line;
    std::vector<DialogueChoice> choices;
    bool open = false;
    // Advisory guard: set while a challenge owns the foreground, gating which
    // top-level operations are legal. Not a concurrency primitive.
    bool locked = false;
};

// Session state machine for the one dialogue that may be open at a time.
class DialogueController
{
public:
    DialogueController(const SpiritRegistry &registry, QuestEngine &quests, CueBus &cues);

    bool Open(const std::string &objectId);
    bool Advance();
    bool SelectChoice(size_t index);
    bool Close();

    // Feeds back a challenge action so completion can release the lock and
    // move the session on to the closing lines.
    void OnChallengeResult(const ChallengeResult &result);

    DialogueState State() const { return state_; }
    bool IsOpen() const { return session_.has_value(); }
    bool IsLocked() const { return session_ && session_->locked; }
    const DialogueSession *Session() const { return session_ ? &*session_ : nullptr; }
    const SpiritObject *Current() const;
    bool DiscoveredAny() const { return discoveredAny_; }

private:
    void Present(const std::string &line);
    void Offer(std::vector<DialogueChoice> choices);
    void OnScriptExhausted();
    bool BeginChallenge();

    const SpiritRegistry &registry_;
    QuestEngine &quests_;
    CueBus &cues_;

    DialogueState state_ = DialogueState::Closed;
    std::optional<DialogueSession> session_;
    bool discoveredAny_ = false;
};
