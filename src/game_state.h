#pragma once

#include "chronicle.h"
#include "cue.h"
#include "dialogue_controller.h"
#include "fragment_ledger.h"
#include "game_config.h"
#include "quest_engine.h"
#include "spirit_registry.h"

#include <memory>
#include <string>
#include <vector>

struct SpiritView
{
    std::string id;
    bool hovered = false;
    bool complete = false;
    QuestStage stage = QuestStage::NotStarted;
};

struct DialogueView
{
    bool open = false;
    bool locked = false;
    DialogueState state = DialogueState::Closed;
    std::string objectId;
    std::string name;
    std::string line;
    std::vector<std::string> choices;
    size_t pendingLines = 0;
};

struct ChallengeView
{
    bool active = false;
    QuestKind kind = QuestKind::None;
    std::string objectId;
    std::string title;
    std::string feedback;
    ChallengeState progress;
    std::vector<std::string> placements;
    float bandMin = 0.0f;
    float bandMax = 1.0f;
    float steadyBelow = 0.0f;
    int minStreak = 0;
};

// Read-only picture of the core handed to the renderer every frame.
struct GameSnapshot
{
    float clock = 0.0f;
    bool discoveredAny = false;
    std::string hoveredId;
    std::string hint;
    std::vector<SpiritView> spirits;
    DialogueView dialogue;
    ChallengeView challenge;
    LedgerSnapshot ledger;
    std::string tierNote;
};

class GameState
{
public:
    explicit GameState(const GameConfig &config, SpiritRegistry registry = SpiritRegistry::DefaultRoom(),
                       std::unique_ptr<DriftSource> drift = nullptr);

    GameState(const GameState &) = delete;
    GameState &operator=(const GameState &) = delete;

    bool Ready() const { return ready_; }

    // Input events, already resolved to logical form.
    bool Select(const std::string &objectId);
    bool SelectAt(Vector2 scenePoint);
    void SetHovered(const std::string &objectId);
    void HoverAt(Vector2 scenePoint);
    bool Advance();
    bool Choose(size_t index);
    bool Close();

    ChallengeResult SetHeat(float value);
    ChallengeResult PeekHeat();
    ChallengeResult Evaluate();
    ChallengeResult ResetHeat();
    ChallengeResult Focus();
    ChallengeResult Attempt();
    ChallengeResult Rest();
    ChallengeResult Place(size_t placementIndex);

    // One drift step for the running streak challenge; elapsed is clamped to
    // the configured per-tick maximum before it feeds the scene clock.
    bool Tick(float elapsedSeconds);

    GameSnapshot Snapshot() const;

    Chronicle &Log() { return chronicle_; }
    const Chronicle &Log() const { return chronicle_; }
    CueBus &Cues() { return cues_; }
    const SpiritRegistry &Registry() const { return registry_; }
    const FragmentLedger &Ledger() const { return ledger_; }
    const QuestEngine &Quests() const { return quests_; }
    const DialogueController &Dialogue() const { return dialogue_; }
    float Clock() const { return clock_; }

private:
    static SpiritRegistry Checked(SpiritRegistry registry, Chronicle &chronicle, bool &ready);
    ChallengeResult Route(ChallengeResult result);

    GameConfig config_;
    Chronicle chronicle_;
    CueBus cues_;
    ChronicleCueSink chronicleSink_;
    bool ready_ = false;
    SpiritRegistry registry_;
    FragmentLedger ledger_;
    std::unique_ptr<DriftSource> drift_;
    QuestEngine quests_;
    DialogueController dialogue_;

    std::string hoveredId_;
    float clock_ = 0.0f;
};
