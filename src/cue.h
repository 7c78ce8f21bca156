#pragma once

#include <string>
#include <vector>

class Chronicle;

enum class CueKind
{
    DialogueOpened,
    DialogueClosed,
    LinePresented,
    AdvanceBlocked,
    ChoicesOffered,
    ChallengeStarted,
    ChallengeFeedback,
    ChallengeSucceeded,
    ChallengeFailed,
    QuestCompleted,
    FragmentAwarded,
    EmptyClick,
    HeatChanged
};

struct Cue
{
    CueKind kind = CueKind::LinePresented;
    std::string objectId;
    std::string text;
    float value = 0.0f;
};

const char *CueKindLabel(CueKind kind);

// Fire-and-forget listener for audio and feedback effects.
class CueSink
{
public:
    virtual ~CueSink() = default;
    virtual void OnCue(const Cue &cue) = 0;
};

// Fans cues out to registered sinks. A sink that throws is logged and skipped;
// dispatch never changes the caller's state.
class CueBus
{
public:
    explicit CueBus(Chronicle &chronicle);

    void Attach(CueSink *sink);
    void Detach(CueSink *sink);

    void Emit(const Cue &cue);
    void Emit(CueKind kind, const std::string &objectId, const std::string &text = std::string(), float value = 0.0f);

private:
    Chronicle &chronicle_;
    std::vector<CueSink *> sinks_;
};

// Writes the cues worth remembering into the chronicle.
class ChronicleCueSink : public CueSink
{
public:
    explicit ChronicleCueSink(Chronicle &chronicle) : chronicle_(chronicle) {}

    void OnCue(const Cue &cue) override;

private:
    Chronicle &chronicle_;
};
