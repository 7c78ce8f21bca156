#include "quest_engine.h"

#include "chronicle.h"
#include "cue.h"
#include "fragment_ledger.h"

#include <algorithm>
#include <cmath>

const char *QuestStageLabel(QuestStage stage)
{
    switch (stage)
    {
    case QuestStage::NotStarted:
        return "NotStarted";
    case QuestStage::InProgress:
        return "InProgress";
    case QuestStage::Complete:
        return "Complete";
    default:
        return "Unknown";
    }
}

RandomDrift::RandomDrift(uint32_t seed) : engine_(seed != 0 ? seed : std::random_device{}())
{
}

float RandomDrift::Next(float min, float max)
{
    if (max <= min)
    {
        return min;
    }
    std::uniform_real_distribution<float> dist(min, max);
    return dist(engine_);
}

static float Clamp01(float value)
{
    return std::clamp(value, 0.0f, 1.0f);
}

QuestEngine::QuestEngine(const SpiritRegistry &registry, FragmentLedger &ledger, CueBus &cues, Chronicle &chronicle,
                         DriftSource &drift)
    : registry_(registry), ledger_(ledger), cues_(cues), chronicle_(chronicle), drift_(drift)
{
    for (const auto &o : registry_.Objects())
    {
        if (o.quest.kind != QuestKind::None)
        {
            stages_[o.id] = QuestStage::NotStarted;
        }
    }
}

QuestStage QuestEngine::Stage(const std::string &objectId) const
{
    const auto it = stages_.find(objectId);
    return it == stages_.end() ? QuestStage::NotStarted : it->second;
}

bool QuestEngine::HasQuest(const std::string &objectId) const
{
    return stages_.find(objectId) != stages_.end();
}

bool QuestEngine::Start(const std::string &objectId)
{
    const auto it = stages_.find(objectId);
    if (it == stages_.end() || it->second != QuestStage::NotStarted)
    {
        return false;
    }
    const SpiritObject *object = registry_.Find(objectId);
    if (object == nullptr)
    {
        return false;
    }

    it->second = QuestStage::InProgress;
    chronicle_.Push("QUEST STARTED", object->quest.title);

    if (object->quest.kind == QuestKind::Discover)
    {
        Complete(*object);
        return true;
    }

    Arm(*object);
    cues_.Emit(CueKind::ChallengeStarted, objectId, object->quest.title);
    return true;
}

bool QuestEngine::Resume(const std::string &objectId)
{
    const SpiritObject *object = registry_.Find(objectId);
    if (object == nullptr || !IsInteractive(object->quest.kind) || Stage(objectId) != QuestStage::InProgress)
    {
        return false;
    }

    Arm(*object);
    chronicle_.Push("QUEST RESUMED", object->quest.title);
    cues_.Emit(CueKind::ChallengeStarted, objectId, object->quest.title);
    return true;
}

void QuestEngine::Abandon()
{
    activeId_.clear();
    active_ = DiscoverChallenge{};
    lastFeedback_.clear();
}

void QuestEngine::Arm(const SpiritObject &object)
{
    activeId_ = object.id;
    lastFeedback_.clear();

    switch (object.quest.kind)
    {
    case QuestKind::Calibration:
    {
        CalibrationChallenge c;
        c.value = Clamp01(object.quest.calibration.initial);
        active_ = c;
        break;
    }
    case QuestKind::Streak:
    {
        StreakChallenge s;
        s.target = object.quest.streak.target;
        active_ = s;
        break;
    }
    case QuestKind::Threshold:
    {
        ThresholdChallenge t;
        t.target = object.quest.threshold.target;
        active_ = t;
        break;
    }
    default:
        active_ = DiscoverChallenge{};
        break;
    }
}

const SpiritObject *QuestEngine::ActiveObject() const
{
    if (activeId_.empty())
    {
        return nullptr;
    }
    return registry_.Find(activeId_);
}

ChallengeResult QuestEngine::Finish(ChallengeResult result)
{
    result.handled = true;
    lastFeedback_ = result.feedback;

    const SpiritObject *object = ActiveObject();
    const bool satisfied = std::visit([](const auto &challenge) { return challenge.IsSatisfied(); }, active_);
    if (object != nullptr && satisfied && Stage(object->id) == QuestStage::InProgress)
    {
        Complete(*object);
        result.completed = true;
    }
    return result;
}

void QuestEngine::Complete(const SpiritObject &object)
{
    stages_[object.id] = QuestStage::Complete;
    activeId_.clear();
    chronicle_.Push("QUEST COMPLETE", object.quest.title);
    cues_.Emit(CueKind::QuestCompleted, object.id, object.quest.title);

    if (ledger_.Award(object.fragmentSlot) == AwardResult::NewlyAwarded)
    {
        cues_.Emit(CueKind::FragmentAwarded, object.id, object.name, static_cast<float>(ledger_.Count()));
    }
}

ChallengeResult QuestEngine::SetValue(float value)
{
    auto *c = std::get_if<CalibrationChallenge>(&active_);
    // A non-finite value would slip past both band comparisons.
    if (c == nullptr || ActiveObject() == nullptr || !std::isfinite(value))
    {
        return ChallengeResult{};
    }

    c->value = Clamp01(value);
    cues_.Emit(CueKind::HeatChanged, activeId_, std::string(), c->value);

    ChallengeResult result;
    result.handled = true;
    result.verdict = Verdict::Adjusted;
    return result;
}

ChallengeResult QuestEngine::Peek()
{
    const auto *c = std::get_if<CalibrationChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (c == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    // Band edges count as inside.
    const CalibrationSpec &tuning = object->quest.calibration;
    ChallengeResult result;
    if (c->value < tuning.bandMin)
    {
        result.verdict = Verdict::Below;
        result.feedback = tuning.peekBelow;
    }
    else if (c->value > tuning.bandMax)
    {
        result.verdict = Verdict::Above;
        result.feedback = tuning.peekAbove;
    }
    else
    {
        result.verdict = Verdict::Within;
        result.feedback = tuning.peekWithin;
    }
    cues_.Emit(CueKind::ChallengeFeedback, activeId_, result.feedback);
    result.handled = true;
    lastFeedback_ = result.feedback;
    return result;
}

ChallengeResult QuestEngine::Evaluate()
{
    auto *c = std::get_if<CalibrationChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (c == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    const CalibrationSpec &tuning = object->quest.calibration;
    ChallengeResult result;
    if (c->value < tuning.bandMin)
    {
        result.verdict = Verdict::Below;
        result.feedback = tuning.belowLine;
        cues_.Emit(CueKind::ChallengeFailed, activeId_, result.feedback);
    }
    else if (c->value > tuning.bandMax)
    {
        result.verdict = Verdict::Above;
        result.feedback = tuning.aboveLine;
        cues_.Emit(CueKind::ChallengeFailed, activeId_, result.feedback);
    }
    else
    {
        result.verdict = Verdict::Within;
        result.feedback = tuning.withinLine;
        c->accepted = true;
        cues_.Emit(CueKind::ChallengeSucceeded, activeId_, result.feedback);
    }
    return Finish(result);
}

ChallengeResult QuestEngine::Reset()
{
    auto *c = std::get_if<CalibrationChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (c == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    c->value = Clamp01(object->quest.calibration.initial);
    ChallengeResult result;
    result.verdict = Verdict::Calm;
    result.feedback = object->quest.calibration.resetLine;
    cues_.Emit(CueKind::ChallengeFeedback, activeId_, result.feedback);
    return Finish(result);
}

bool QuestEngine::Tick()
{
    auto *s = std::get_if<StreakChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (s == nullptr || object == nullptr)
    {
        return false;
    }

    const StreakSpec &tuning = object->quest.streak;
    float step = drift_.Next(tuning.driftMin, tuning.driftMax);
    if (++s->quietTicks > tuning.settleAfter)
    {
        step -= tuning.settleRate * s->instability;
    }
    s->instability = Clamp01(s->instability + step);
    if (s->instability < tuning.steadyBelow)
    {
        ++s->steadyStreak;
    }
    else
    {
        s->steadyStreak = 0;
    }
    return true;
}

ChallengeResult QuestEngine::Focus()
{
    auto *s = std::get_if<StreakChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (s == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    s->instability = Clamp01(s->instability - object->quest.streak.focusStep);
    s->quietTicks = 0;
    ChallengeResult result;
    result.verdict = Verdict::Focused;
    result.feedback = object->quest.streak.focusLine;
    cues_.Emit(CueKind::ChallengeFeedback, activeId_, result.feedback);
    return Finish(result);
}

ChallengeResult QuestEngine::Attempt()
{
    auto *s = std::get_if<StreakChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (s == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    const StreakSpec &tuning = object->quest.streak;
    s->quietTicks = 0;
    ChallengeResult result;
    if (s->steadyStreak >= tuning.minStreak)
    {
        ++s->progress;
        s->instability = Clamp01(s->instability + tuning.successKick);
        result.verdict = Verdict::Glow;
        result.feedback = tuning.successLine + TextFormat(" (%d/%d)", s->progress, s->target);
        cues_.Emit(CueKind::ChallengeSucceeded, activeId_, result.feedback);
    }
    else
    {
        s->instability = Clamp01(s->instability + tuning.failureKick);
        result.verdict = Verdict::Flicker;
        result.feedback = tuning.failureLine;
        cues_.Emit(CueKind::ChallengeFailed, activeId_, result.feedback);
    }
    return Finish(result);
}

ChallengeResult QuestEngine::Rest()
{
    const SpiritObject *object = ActiveObject();
    if (!std::holds_alternative<StreakChallenge>(active_) || object == nullptr)
    {
        return ChallengeResult{};
    }

    ChallengeResult result;
    result.verdict = Verdict::Rested;
    result.feedback = object->quest.streak.restLine;
    cues_.Emit(CueKind::ChallengeFeedback, activeId_, result.feedback);
    return Finish(result);
}

ChallengeResult QuestEngine::Place(size_t placementIndex)
{
    auto *t = std::get_if<ThresholdChallenge>(&active_);
    const SpiritObject *object = ActiveObject();
    if (t == nullptr || object == nullptr)
    {
        return ChallengeResult{};
    }

    const ThresholdSpec &tuning = object->quest.threshold;
    if (placementIndex >= tuning.placements.size())
    {
        return ChallengeResult{};
    }

    ++t->placed;
    t->lastItem = tuning.placements[placementIndex];
    ChallengeResult result;
    result.verdict = Verdict::Placed;
    result.feedback = t->lastItem + " " + tuning.placedLine + TextFormat(" (%d/%d)", t->placed, t->target);
    cues_.Emit(CueKind::ChallengeFeedback, activeId_, result.feedback);
    return Finish(result);
}
