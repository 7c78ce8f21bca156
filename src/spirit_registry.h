#pragma once

#include "raylib.h"

#include <cstddef>

#include <string>
#include <vector>

constexpr int kFragmentSlots = 12;

enum class QuestKind
{
    None,
    Discover,
    Calibration,
    Streak,
    Threshold
};

struct CalibrationSpec
{
    float initial = 0.5f;
    float bandMin = 0.42f;
    float bandMax = 0.62f;
    std::string peekBelow;
    std::string peekAbove;
    std::string peekWithin;
    std::string belowLine;
    std::string aboveLine;
    std::string withinLine;
    std::string resetLine;
};

struct StreakSpec
{
    float steadyBelow = 0.28f;
    int minStreak = 10;
    int target = 3;
    float focusStep = 0.22f;
    float successKick = 0.15f;
    float failureKick = 0.08f;
    float driftMin = -0.03f;
    float driftMax = 0.05f;
    // Left alone for longer than settleAfter ticks, the light is pulled back
    // toward calm by settleRate of its instability each tick. The pull outweighs
    // driftMax, so waiting always reaches a steady streak.
    int settleAfter = 30;
    float settleRate = 0.2f;
    std::string focusLine;
    std::string successLine; // followed by " (progress/target)"
    std::string failureLine;
    std::string restLine;
};

struct ThresholdSpec
{
    int target = 2;
    std::vector<std::string> placements;
    std::string placedLine; // "<item> <placedLine> (placed/target)"
};

struct QuestDescriptor
{
    QuestKind kind = QuestKind::None;
    std::string title;
    std::string brief;
    std::string companionLabel;
    CalibrationSpec calibration;
    StreakSpec streak;
    ThresholdSpec threshold;
};

struct Script
{
    std::vector<std::string> intro;
    std::vector<std::string> after;
};

struct SpiritObject
{
    std::string id;
    std::string name;
    Rectangle bounds{};
    std::string hint;
    std::string mood;
    std::string icon;
    Color colorA{};
    Color colorB{};
    int fragmentSlot = -1;
    Script script;
    QuestDescriptor quest;
};

const char *QuestKindLabel(QuestKind kind);
bool IsInteractive(QuestKind kind);

// Immutable catalog of the scene's spirits.
class SpiritRegistry
{
public:
    SpiritRegistry() = default;
    explicit SpiritRegistry(std::vector<SpiritObject> objects);

    static SpiritRegistry DefaultRoom();

    // Rejects empty or duplicate ids and fragment slots that are out of range
    // or shared between objects.
    static bool Validate(const std::vector<SpiritObject> &objects, std::string &error);

    const SpiritObject *Find(const std::string &id) const;
    const SpiritObject *Pick(Vector2 point) const;
    const std::vector<SpiritObject> &Objects() const { return objects_; }
    size_t Size() const { return objects_.size(); }

private:
    std::vector<SpiritObject> objects_;
};
