#pragma once

#include "spirit_registry.h"

#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <variant>

class Chronicle;
class CueBus;
class FragmentLedger;

enum class QuestStage
{
    NotStarted,
    InProgress,
    Complete
};

const char *QuestStageLabel(QuestStage stage);

enum class Verdict
{
    None,
    Adjusted,
    Below,
    Above,
    Within,
    Calm,
    Focused,
    Glow,
    Flicker,
    Rested,
    Placed
};

struct ChallengeResult
{
    bool handled = false;
    Verdict verdict = Verdict::None;
    std::string feedback;
    bool completed = false;
};

// Per-attempt progress of each challenge variant. Rebuilt on every start or
// resume; only meaningful while the quest is in progress.
struct DiscoverChallenge
{
    bool IsSatisfied() const { return true; }
};

struct CalibrationChallenge
{
    float value = 0.5f;
    bool accepted = false;

    bool IsSatisfied() const { return accepted; }
};

struct StreakChallenge
{
    float instability = 0.0f;
    int steadyStreak = 0;
    int quietTicks = 0; // ticks since the last focus or attempt
    int progress = 0;
    int target = 3;

    bool IsSatisfied() const { return progress >= target; }
};

struct ThresholdChallenge
{
    int placed = 0;
    int target = 2;
    std::string lastItem;

    bool IsSatisfied() const { return placed >= target; }
};

using ChallengeState = std::variant<DiscoverChallenge, CalibrationChallenge, StreakChallenge, ThresholdChallenge>;

// Source of the streak variant's per-tick instability drift.
class DriftSource
{
public:
    virtual ~DriftSource() = default;
    virtual float Next(float min, float max) = 0;
};

class RandomDrift : public DriftSource
{
public:
    // A zero seed draws one from std::random_device.
    explicit RandomDrift(uint32_t seed = 0);

    float Next(float min, float max) override;

private:
    std::mt19937 engine_;
};

class QuestEngine
{
public:
    QuestEngine(const SpiritRegistry &registry, FragmentLedger &ledger, CueBus &cues, Chronicle &chronicle,
                DriftSource &drift);

    QuestStage Stage(const std::string &objectId) const;
    bool HasQuest(const std::string &objectId) const;

    // NotStarted -> InProgress. Discover quests complete on the spot.
    bool Start(const std::string &objectId);
    // Re-arms a fresh attempt for a quest left InProgress.
    bool Resume(const std::string &objectId);
    // Drops the running attempt; the quest stage is untouched.
    void Abandon();

    bool HasActiveChallenge() const { return !activeId_.empty(); }
    const std::string &ActiveId() const { return activeId_; }
    const ChallengeState &Active() const { return active_; }
    const std::string &LastFeedback() const { return lastFeedback_; }

    // Calibration
    ChallengeResult SetValue(float value);
    ChallengeResult Peek();
    ChallengeResult Evaluate();
    ChallengeResult Reset();

    // Streak
    bool Tick();
    ChallengeResult Focus();
    ChallengeResult Attempt();
    ChallengeResult Rest();

    // Threshold
    ChallengeResult Place(size_t placementIndex);

private:
    const SpiritObject *ActiveObject() const;
    void Arm(const SpiritObject &object);
    ChallengeResult Finish(ChallengeResult result);
    void Complete(const SpiritObject &object);

    const SpiritRegistry &registry_;
    FragmentLedger &ledger_;
    CueBus &cues_;
    Chronicle &chronicle_;
    DriftSource &drift_;

    std::unordered_map<std::string, QuestStage> stages_;
    std::string activeId_;
    ChallengeState active_;
    std::string lastFeedback_;
};
