#include "game_state.h"

#include <algorithm>
#include <cmath>
#include <utility>

GameState::GameState(const GameConfig &config, SpiritRegistry registry, std::unique_ptr<DriftSource> drift)
    : config_(config),
      chronicle_(config.chronicleLines),
      cues_(chronicle_),
      chronicleSink_(chronicle_),
      registry_(Checked(std::move(registry), chronicle_, ready_)),
      ledger_(chronicle_),
      drift_(drift ? std::move(drift)
                   : std::unique_ptr<DriftSource>(std::make_unique<RandomDrift>(config.driftSeed))),
      quests_(registry_, ledger_, cues_, chronicle_, *drift_),
      dialogue_(registry_, quests_, cues_)
{
    cues_.Attach(&chronicleSink_);
    if (ready_)
    {
        chronicle_.Push("ROOM READY", TextFormat("%d spirits hidden", static_cast<int>(registry_.Size())));
    }
}

SpiritRegistry GameState::Checked(SpiritRegistry registry, Chronicle &chronicle, bool &ready)
{
    std::string error;
    ready = SpiritRegistry::Validate(registry.Objects(), error);
    if (!ready)
    {
        chronicle.Push("ROOM ERROR", error);
        return SpiritRegistry();
    }
    return registry;
}

bool GameState::Select(const std::string &objectId)
{
    return dialogue_.Open(objectId);
}

bool GameState::SelectAt(Vector2 scenePoint)
{
    const SpiritObject *object = registry_.Pick(scenePoint);
    if (object == nullptr)
    {
        cues_.Emit(CueKind::EmptyClick, std::string());
        return false;
    }
    return Select(object->id);
}

void GameState::SetHovered(const std::string &objectId)
{
    hoveredId_ = registry_.Find(objectId) != nullptr ? objectId : std::string();
}

void GameState::HoverAt(Vector2 scenePoint)
{
    const SpiritObject *object = registry_.Pick(scenePoint);
    hoveredId_ = object != nullptr ? object->id : std::string();
}

bool GameState::Advance()
{
    return dialogue_.Advance();
}

bool GameState::Choose(size_t index)
{
    return dialogue_.SelectChoice(index);
}

bool GameState::Close()
{
    return dialogue_.Close();
}

ChallengeResult GameState::Route(ChallengeResult result)
{
    dialogue_.OnChallengeResult(result);
    return result;
}

ChallengeResult GameState::SetHeat(float value)
{
    return dialogue_.IsLocked() ? Route(quests_.SetValue(value)) : ChallengeResult{};
}

ChallengeResult GameState::PeekHeat()
{
    return dialogue_.IsLocked() ? Route(quests_.Peek()) : ChallengeResult{};
}

ChallengeResult GameState::Evaluate()
{
    return dialogue_.IsLocked() ? Route(quests_.Evaluate()) : ChallengeResult{};
}

ChallengeResult GameState::ResetHeat()
{
    return dialogue_.IsLocked() ? Route(quests_.Reset()) : ChallengeResult{};
}

ChallengeResult GameState::Focus()
{
    return dialogue_.IsLocked() ? Route(quests_.Focus()) : ChallengeResult{};
}

ChallengeResult GameState::Attempt()
{
    return dialogue_.IsLocked() ? Route(quests_.Attempt()) : ChallengeResult{};
}

ChallengeResult GameState::Rest()
{
    return dialogue_.IsLocked() ? Route(quests_.Rest()) : ChallengeResult{};
}

ChallengeResult GameState::Place(size_t placementIndex)
{
    return dialogue_.IsLocked() ? Route(quests_.Place(placementIndex)) : ChallengeResult{};
}

bool GameState::Tick(float elapsedSeconds)
{
    if (std::isfinite(elapsedSeconds))
    {
        clock_ += std::clamp(elapsedSeconds, 0.0f, config_.maxTickSeconds);
    }
    return quests_.Tick();
}

GameSnapshot GameState::Snapshot() const
{
    GameSnapshot snap;
    snap.clock = clock_;
    snap.discoveredAny = dialogue_.DiscoveredAny();
    snap.hoveredId = hoveredId_;

    for (const auto &o : registry_.Objects())
    {
        SpiritView view;
        view.id = o.id;
        view.hovered = (o.id == hoveredId_);
        view.stage = quests_.Stage(o.id);
        view.complete = (view.stage == QuestStage::Complete);
        if (view.hovered)
        {
            snap.hint = o.hint;
        }
        snap.spirits.push_back(view);
    }

    if (const DialogueSession *session = dialogue_.Session())
    {
        DialogueView &d = snap.dialogue;
        d.open = session->open;
        d.locked = session->locked;
        d.state = dialogue_.State();
        d.objectId = session->objectId;
        d.line = session->line;
        d.pendingLines = session->pending.size();
        for (const auto &c : session->choices)
        {
            d.choices.push_back(c.label);
        }
        if (const SpiritObject *o = dialogue_.Current())
        {
            d.name = o->name;
        }
    }

    if (quests_.HasActiveChallenge())
    {
        ChallengeView &c = snap.challenge;
        c.active = true;
        c.objectId = quests_.ActiveId();
        c.progress = quests_.Active();
        c.feedback = quests_.LastFeedback();
        if (const SpiritObject *o = registry_.Find(c.objectId))
        {
            c.kind = o->quest.kind;
            c.title = o->quest.title;
            c.placements = o->quest.threshold.placements;
            c.bandMin = o->quest.calibration.bandMin;
            c.bandMax = o->quest.calibration.bandMax;
            c.steadyBelow = o->quest.streak.steadyBelow;
            c.minStreak = o->quest.streak.minStreak;
        }
    }

    snap.ledger = ledger_.Snapshot();
    snap.tierNote = FragmentLedger::TierNote(snap.ledger.tier);
    return snap;
}
