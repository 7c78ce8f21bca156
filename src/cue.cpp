#include "cue.h"

#include "chronicle.h"

#include <algorithm>
#include <exception>

const char *CueKindLabel(CueKind kind)
{
    switch (kind)
    {
    case CueKind::DialogueOpened:
        return "DialogueOpened";
    case CueKind::DialogueClosed:
        return "DialogueClosed";
    case CueKind::LinePresented:
        return "LinePresented";
    case CueKind::AdvanceBlocked:
        return "AdvanceBlocked";
    case CueKind::ChoicesOffered:
        return "ChoicesOffered";
    case CueKind::ChallengeStarted:
        return "ChallengeStarted";
    case CueKind::ChallengeFeedback:
        return "ChallengeFeedback";
    case CueKind::ChallengeSucceeded:
        return "ChallengeSucceeded";
    case CueKind::ChallengeFailed:
        return "ChallengeFailed";
    case CueKind::QuestCompleted:
        return "QuestCompleted";
    case CueKind::FragmentAwarded:
        return "FragmentAwarded";
    case CueKind::EmptyClick:
        return "EmptyClick";
    case CueKind::HeatChanged:
        return "HeatChanged";
    default:
        return "Unknown";
    }
}

CueBus::CueBus(Chronicle &chronicle) : chronicle_(chronicle)
{
}

void CueBus::Attach(CueSink *sink)
{
    if (sink == nullptr || std::find(sinks_.begin(), sinks_.end(), sink) != sinks_.end())
    {
        return;
    }
    sinks_.push_back(sink);
}

void CueBus::Detach(CueSink *sink)
{
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void CueBus::Emit(const Cue &cue)
{
    for (CueSink *sink : sinks_)
    {
        try
        {
            sink->OnCue(cue);
        }
        catch (const std::exception &e)
        {
            chronicle_.Push("CUE SINK FAILED", std::string(CueKindLabel(cue.kind)) + " " + e.what());
        }
    }
}

void CueBus::Emit(CueKind kind, const std::string &objectId, const std::string &text, float value)
{
    Cue cue;
    cue.kind = kind;
    cue.objectId = objectId;
    cue.text = text;
    cue.value = value;
    Emit(cue);
}

void ChronicleCueSink::OnCue(const Cue &cue)
{
    switch (cue.kind)
    {
    case CueKind::DialogueOpened:
        chronicle_.Push("DIALOGUE OPEN", cue.objectId);
        break;
    case CueKind::DialogueClosed:
        chronicle_.Push("DIALOGUE CLOSED", cue.objectId);
        break;
    case CueKind::ChallengeSucceeded:
    case CueKind::ChallengeFailed:
        chronicle_.Push(cue.kind == CueKind::ChallengeSucceeded ? "ATTEMPT OK" : "ATTEMPT MISSED", cue.objectId);
        break;
    default:
        break;
    }
}
