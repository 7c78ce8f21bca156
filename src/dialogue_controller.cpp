#include "dialogue_controller.h"

#include "cue.h"

#include <utility>

namespace
{
const char *kBeginLabel = "Help them with a tiny problem";
const char *kCompanyLabel = "Just keep them company";
const char *kBackAwayLabel = "Back away gently";
const char *kOkayLabel = "Okay";
const char *kThankLabel = "Thank them";
const char *kLeaveLabel = "Leave quietly";
const char *kAcknowledgeFallback = "Leave them a quiet moment";
const char *kCompanyLine = "You stay for a moment. The room doesn't ask anything more from you.";
} // namespace

const char *DialogueStateLabel(DialogueState state)
{
    switch (state)
    {
    case DialogueState::Closed:
        return "Closed";
    case DialogueState::Presenting:
        return "Presenting";
    case DialogueState::ChoicePending:
        return "ChoicePending";
    case DialogueState::ChallengeActive:
        return "ChallengeActive";
    default:
        return "Unknown";
    }
}

DialogueController::DialogueController(const SpiritRegistry &registry, QuestEngine &quests, CueBus &cues)
    : registry_(registry), quests_(quests), cues_(cues)
{
}

const SpiritObject *DialogueController::Current() const
{
    return session_ ? registry_.Find(session_->objectId) : nullptr;
}

bool DialogueController::Open(const std::string &objectId)
{
    const SpiritObject *object = registry_.Find(objectId);
    if (object == nullptr)
    {
        return false;
    }
    if (session_ && session_->locked)
    {
        return false;
    }
    if (session_)
    {
        Close();
    }

    DialogueSession session;
    session.objectId = objectId;
    session.open = true;
    session.locked = false;
    const auto &lines =
        quests_.Stage(objectId) == QuestStage::Complete ? object->script.after : object->script.intro;
    session.pending.assign(lines.begin(), lines.end());
    session_ = std::move(session);
    discoveredAny_ = true;

    cues_.Emit(CueKind::DialogueOpened, objectId, object->name);
    Advance();
    return true;
}

bool DialogueController::Advance()
{
    if (!session_)
    {
        return false;
    }
    if (session_->locked)
    {
        cues_.Emit(CueKind::AdvanceBlocked, session_->objectId);
        return false;
    }

    if (!session_->pending.empty())
    {
        const std::string line = session_->pending.front();
        session_->pending.pop_front();
        session_->choices.clear();
        state_ = DialogueState::Presenting;
        Present(line);
        return true;
    }

    OnScriptExhausted();
    return true;
}

void DialogueController::OnScriptExhausted()
{
    const SpiritObject *object = Current();
    if (object == nullptr)
    {
        Close();
        return;
    }

    const QuestStage stage = quests_.Stage(object->id);
    if (object->quest.kind == QuestKind::None || stage == QuestStage::Complete)
    {
        Close();
        return;
    }

    if (object->quest.kind == QuestKind::Discover)
    {
        quests_.Start(object->id);
        const std::string label =
            object->quest.companionLabel.empty() ? kAcknowledgeFallback : object->quest.companionLabel;
        Offer({{ChoiceKind::Acknowledge, label}});
        return;
    }

    Offer({
        {ChoiceKind::BeginChallenge, kBeginLabel},
        {ChoiceKind::KeepCompany, kCompanyLabel},
        {ChoiceKind::BackAway, kBackAwayLabel},
    });
}

bool DialogueController::SelectChoice(size_t index)
{
    if (!session_ || index >= session_->choices.size())
    {
        return false;
    }

    const ChoiceKind kind = session_->choices[index].kind;
    switch (kind)
    {
    case ChoiceKind::BeginChallenge:
        return BeginChallenge();
    case ChoiceKind::KeepCompany:
        Present(kCompanyLine);
        Offer({{ChoiceKind::Okay, kOkayLabel}});
        return true;
    case ChoiceKind::ThankThem:
        if (!session_->pending.empty())
        {
            const std::string line = session_->pending.front();
            session_->pending.pop_front();
            Present(line);
            return true;
        }
        return Close();
    case ChoiceKind::Companion:
        return true;
    case ChoiceKind::BackAway:
    case ChoiceKind::Okay:
    case ChoiceKind::Acknowledge:
    case ChoiceKind::LeaveQuietly:
    default:
        return Close();
    }
}

bool DialogueController::BeginChallenge()
{
    const SpiritObject *object = Current();
    if (object == nullptr || !IsInteractive(object->quest.kind))
    {
        return false;
    }

    const QuestStage stage = quests_.Stage(object->id);
    const bool armed = stage == QuestStage::NotStarted ? quests_.Start(object->id) : quests_.Resume(object->id);
    if (!armed)
    {
        return false;
    }

    session_->locked = true;
    state_ = DialogueState::ChallengeActive;
    session_->line = object->quest.brief;
    session_->choices = {{ChoiceKind::Companion, object->quest.companionLabel}};
    return true;
}

void DialogueController::OnChallengeResult(const ChallengeResult &result)
{
    if (!session_ || state_ != DialogueState::ChallengeActive || !result.completed)
    {
        return;
    }
    const SpiritObject *object = Current();
    if (object == nullptr)
    {
        return;
    }

    session_->locked = false;
    session_->pending.assign(object->script.after.begin(), object->script.after.end());
    if (!session_->pending.empty())
    {
        const std::string line = session_->pending.front();
        session_->pending.pop_front();
        Present(line);
    }
    Offer({
        {ChoiceKind::ThankThem, kThankLabel},
        {ChoiceKind::LeaveQuietly, kLeaveLabel},
    });
}

bool DialogueController::Close()
{
    if (!session_)
    {
        return false;
    }

    const std::string objectId = session_->objectId;
    if (quests_.HasActiveChallenge())
    {
        quests_.Abandon();
    }
    session_.reset();
    state_ = DialogueState::Closed;
    cues_.Emit(CueKind::DialogueClosed, objectId);
    return true;
}

void DialogueController::Present(const std::string &line)
{
    session_->line = line;
    cues_.Emit(CueKind::LinePresented, session_->objectId, line);
}

void DialogueController::Offer(std::vector<DialogueChoice> choices)
{
    session_->choices = std::move(choices);
    state_ = DialogueState::ChoicePending;
    cues_.Emit(CueKind::ChoicesOffered, session_->objectId, std::string(), static_cast<float>(session_->choices.size()));
}
