#include "test_support.h"

#include <catch2/catch.hpp>

#include <limits>
#include <variant>

static const CalibrationChallenge &Heat(const QuestEngine &quests)
{
    return std::get<CalibrationChallenge>(quests.Active());
}

static const StreakChallenge &Glow(const QuestEngine &quests)
{
    return std::get<StreakChallenge>(quests.Active());
}

static const ThresholdChallenge &Shelf(const QuestEngine &quests)
{
    return std::get<ThresholdChallenge>(quests.Active());
}

TEST_CASE("quest stages only move forward", "[quest]")
{
    Room room;
    REQUIRE(room.quests.Stage("toaster") == QuestStage::NotStarted);

    REQUIRE(room.quests.Start("toaster"));
    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    REQUIRE_FALSE(room.quests.Start("toaster"));
    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);

    room.quests.SetValue(0.5f);
    room.quests.Evaluate();
    REQUIRE(room.quests.Stage("toaster") == QuestStage::Complete);

    REQUIRE_FALSE(room.quests.Start("toaster"));
    REQUIRE_FALSE(room.quests.Resume("toaster"));
    REQUIRE(room.quests.Stage("toaster") == QuestStage::Complete);
}

TEST_CASE("unknown objects have no quest", "[quest]")
{
    Room room;
    REQUIRE_FALSE(room.quests.HasQuest("clock"));
    REQUIRE_FALSE(room.quests.Start("clock"));
    REQUIRE(room.quests.Stage("clock") == QuestStage::NotStarted);
}

TEST_CASE("calibration clamps heat and classifies against the band", "[quest][calibration]")
{
    Room room;
    room.quests.Start("toaster");
    REQUIRE(Heat(room.quests).value == Approx(0.5f));

    ChallengeResult r = room.quests.SetValue(2.0f);
    REQUIRE(r.handled);
    REQUIRE(Heat(room.quests).value == 1.0f);
    r = room.quests.Evaluate();
    REQUIRE(r.verdict == Verdict::Above);
    REQUIRE_FALSE(r.completed);
    REQUIRE(r.feedback.find("harsh smell") != std::string::npos);

    room.quests.SetValue(-3.0f);
    REQUIRE(Heat(room.quests).value == 0.0f);
    r = room.quests.Evaluate();
    REQUIRE(r.verdict == Verdict::Below);
    REQUIRE_FALSE(r.completed);

    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    REQUIRE_FALSE(room.ledger.Has(0));
    REQUIRE(room.sink.Count(CueKind::ChallengeFailed) == 2);
}

TEST_CASE("non-finite heat is ignored and cannot pass the band", "[quest][calibration]")
{
    Room room;
    room.quests.Start("toaster");
    room.quests.SetValue(0.9f);

    REQUIRE_FALSE(room.quests.SetValue(std::numeric_limits<float>::quiet_NaN()).handled);
    REQUIRE_FALSE(room.quests.SetValue(std::numeric_limits<float>::infinity()).handled);
    REQUIRE(Heat(room.quests).value == Approx(0.9f));

    const ChallengeResult r = room.quests.Evaluate();
    REQUIRE(r.verdict == Verdict::Above);
    REQUIRE_FALSE(r.completed);
    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    REQUIRE_FALSE(room.ledger.Has(0));
}

TEST_CASE("band edges count as inside", "[quest][calibration]")
{
    SECTION("lower edge")
    {
        Room room;
        room.quests.Start("toaster");
        room.quests.SetValue(0.42f);
        REQUIRE(room.quests.Peek().verdict == Verdict::Within);
        REQUIRE(room.quests.Evaluate().completed);
    }
    SECTION("upper edge")
    {
        Room room;
        room.quests.Start("toaster");
        room.quests.SetValue(0.62f);
        REQUIRE(room.quests.Peek().verdict == Verdict::Within);
        REQUIRE(room.quests.Evaluate().completed);
    }
    SECTION("just outside")
    {
        Room room;
        room.quests.Start("toaster");
        room.quests.SetValue(0.419f);
        REQUIRE(room.quests.Evaluate().verdict == Verdict::Below);
        room.quests.SetValue(0.621f);
        REQUIRE(room.quests.Evaluate().verdict == Verdict::Above);
        REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    }
}

TEST_CASE("peeking never completes the quest", "[quest][calibration]")
{
    Room room;
    room.quests.Start("toaster");
    room.quests.SetValue(0.5f);

    for (int i = 0; i < 3; ++i)
    {
        const ChallengeResult r = room.quests.Peek();
        REQUIRE(r.handled);
        REQUIRE(r.verdict == Verdict::Within);
        REQUIRE_FALSE(r.completed);
    }
    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    REQUIRE(room.ledger.Count() == 0);
}

TEST_CASE("breathing restores the midpoint without touching the stage", "[quest][calibration]")
{
    Room room;
    room.quests.Start("toaster");
    room.quests.SetValue(0.9f);

    const ChallengeResult r = room.quests.Reset();
    REQUIRE(r.verdict == Verdict::Calm);
    REQUIRE_FALSE(r.completed);
    REQUIRE(Heat(room.quests).value == Approx(0.5f));
    REQUIRE(room.quests.Stage("toaster") == QuestStage::InProgress);
    REQUIRE(room.quests.LastFeedback() == r.feedback);
}

TEST_CASE("a gentle heat completes the toaster and awards its fragment", "[quest][calibration]")
{
    Room room;
    room.quests.Start("toaster");
    room.quests.SetValue(0.5f);

    const ChallengeResult r = room.quests.Evaluate();
    REQUIRE(r.completed);
    REQUIRE(r.verdict == Verdict::Within);
    REQUIRE(room.quests.Stage("toaster") == QuestStage::Complete);
    REQUIRE(room.ledger.Has(0));
    REQUIRE(room.ledger.Warmth() == Approx(FragmentLedger::kWarmthStep));
    REQUIRE_FALSE(room.quests.HasActiveChallenge());
    REQUIRE(room.sink.Count(CueKind::FragmentAwarded) == 1);
    REQUIRE(room.chronicle.Contains("QUEST COMPLETE // Toaster Courage"));
}

TEST_CASE("drift is clamped to the unit range", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.05f);
    room.quests.Start("lamp");

    for (int i = 0; i < 25; ++i)
    {
        REQUIRE(room.quests.Tick());
    }
    REQUIRE(Glow(room.quests).instability == 1.0f);
    REQUIRE(Glow(room.quests).steadyStreak == 0);

    room.driftSource.Set(-0.05f);
    for (int i = 0; i < 60; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(Glow(room.quests).instability == 0.0f);
}

TEST_CASE("steady streak counts ticks below the threshold and resets above it", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.0f);
    room.quests.Start("lamp");

    for (int i = 0; i < 4; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(Glow(room.quests).steadyStreak == 4);

    room.driftSource.Set(0.3f);
    room.quests.Tick();
    REQUIRE(Glow(room.quests).steadyStreak == 0);
}

TEST_CASE("attempts need a long enough steady streak", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.0f);
    room.quests.Start("lamp");

    ChallengeResult r = room.quests.Attempt();
    REQUIRE(r.verdict == Verdict::Flicker);
    REQUIRE(Glow(room.quests).progress == 0);
    REQUIRE(Glow(room.quests).instability == Approx(0.08f));

    for (int i = 0; i < 9; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(room.quests.Attempt().verdict == Verdict::Flicker);

    room.quests.Tick();
    REQUIRE(Glow(room.quests).steadyStreak == 10);
    r = room.quests.Attempt();
    REQUIRE(r.verdict == Verdict::Glow);
    REQUIRE(r.feedback == "A clean, confident glow! (1/3)");
    REQUIRE(Glow(room.quests).progress == 1);
    REQUIRE(Glow(room.quests).instability == Approx(0.16f + 0.15f));
    REQUIRE(room.quests.Stage("lamp") == QuestStage::InProgress);
}

TEST_CASE("three glows complete the lamp", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), -0.01f);
    room.quests.Start("lamp");

    int completions = 0;
    for (int glow = 0; glow < 3; ++glow)
    {
        room.quests.Focus();
        room.quests.Focus();
        for (int i = 0; i < 10; ++i)
        {
            room.quests.Tick();
        }
        const ChallengeResult r = room.quests.Attempt();
        REQUIRE(r.verdict == Verdict::Glow);
        completions += r.completed ? 1 : 0;
    }
    REQUIRE(completions == 1);
    REQUIRE(room.quests.Stage("lamp") == QuestStage::Complete);
    REQUIRE(room.ledger.Has(1));
    REQUIRE_FALSE(room.quests.Tick());
}

TEST_CASE("a light left alone settles even under the worst drift", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.05f);
    room.quests.Start("lamp");
    const StreakSpec &tuning = room.registry.Find("lamp")->quest.streak;
    REQUIRE(room.driftSource.Next(tuning.driftMin, tuning.driftMax) == tuning.driftMax);

    // Rushing keeps it flickering.
    for (int i = 0; i < 40; ++i)
    {
        room.quests.Tick();
        REQUIRE(room.quests.Attempt().verdict == Verdict::Flicker);
    }
    REQUIRE(Glow(room.quests).instability == 1.0f);

    for (int i = 0; i < tuning.settleAfter; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(Glow(room.quests).instability == 1.0f);
    room.quests.Tick();
    REQUIRE(Glow(room.quests).instability < 1.0f);
}

TEST_CASE("unfocused attempts reach the target when the player waits", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.05f);
    room.quests.Start("lamp");

    int glows = 0;
    for (int round = 0; round < 10 && room.quests.HasActiveChallenge(); ++round)
    {
        for (int i = 0; i < 80; ++i)
        {
            room.quests.Tick();
        }
        glows += room.quests.Attempt().verdict == Verdict::Glow ? 1 : 0;
    }
    REQUIRE(glows == 3);
    REQUIRE(room.quests.Stage("lamp") == QuestStage::Complete);
    REQUIRE(room.ledger.Has(1));
}

TEST_CASE("focus calms deterministically and rest changes nothing", "[quest][streak]")
{
    Room room(SpiritRegistry::DefaultRoom(), 0.05f);
    room.quests.Start("lamp");
    for (int i = 0; i < 25; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(Glow(room.quests).instability == 1.0f);

    REQUIRE(room.quests.Focus().verdict == Verdict::Focused);
    REQUIRE(Glow(room.quests).instability == Approx(0.78f));

    const StreakChallenge before = Glow(room.quests);
    const ChallengeResult r = room.quests.Rest();
    REQUIRE(r.verdict == Verdict::Rested);
    REQUIRE(Glow(room.quests).instability == before.instability);
    REQUIRE(Glow(room.quests).steadyStreak == before.steadyStreak);
    REQUIRE(Glow(room.quests).progress == before.progress);
}

TEST_CASE("the shelf needs exactly its target of placements", "[quest][threshold]")
{
    Room room;
    room.quests.Start("teacup");

    ChallengeResult r = room.quests.Place(0);
    REQUIRE(r.verdict == Verdict::Placed);
    REQUIRE(r.feedback == "A sugar cube placed. The shelf feels a little kinder. (1/2)");
    REQUIRE_FALSE(r.completed);
    REQUIRE(room.quests.Stage("teacup") == QuestStage::InProgress);
    REQUIRE_FALSE(room.ledger.Has(2));

    r = room.quests.Place(2);
    REQUIRE(r.completed);
    REQUIRE(r.feedback == "A cookie placed. The shelf feels a little kinder. (2/2)");
    REQUIRE(room.quests.Stage("teacup") == QuestStage::Complete);
    REQUIRE(room.ledger.Has(2));

    r = room.quests.Place(1);
    REQUIRE_FALSE(r.handled);
    REQUIRE(room.quests.Stage("teacup") == QuestStage::Complete);
    REQUIRE(room.ledger.Count() == 1);
}

TEST_CASE("authored feedback is printed as written", "[quest]")
{
    SpiritObject shelf = MakeSpirit("shelf", QuestKind::Threshold, 0);
    shelf.quest.threshold.target = 2;
    shelf.quest.threshold.placements = {"A %s coin"};
    shelf.quest.threshold.placedLine = "sits at 100% %d.";
    SpiritObject star = MakeSpirit("star", QuestKind::Streak, 1);
    star.quest.streak.successLine = "Glow %n%s!";
    Room room(SpiritRegistry(std::vector<SpiritObject>{shelf, star}), 0.0f);

    room.quests.Start("shelf");
    REQUIRE(room.quests.Place(0).feedback == "A %s coin sits at 100% %d. (1/2)");
    room.quests.Place(0);

    room.quests.Start("star");
    for (int i = 0; i < 10; ++i)
    {
        room.quests.Tick();
    }
    REQUIRE(room.quests.Attempt().feedback == "Glow %n%s! (1/3)");
}

TEST_CASE("any mix of items counts toward the shelf", "[quest][threshold]")
{
    Room room;
    room.quests.Start("teacup");
    REQUIRE_FALSE(room.quests.Place(1).completed);
    REQUIRE(room.quests.Place(1).completed);
}

TEST_CASE("unknown placements are ignored", "[quest][threshold]")
{
    Room room;
    room.quests.Start("teacup");
    REQUIRE_FALSE(room.quests.Place(7).handled);
    REQUIRE(Shelf(room.quests).placed == 0);
}

TEST_CASE("actions for another variant are not handled", "[quest]")
{
    Room room;
    REQUIRE_FALSE(room.quests.Evaluate().handled);
    REQUIRE_FALSE(room.quests.Tick());

    room.quests.Start("teacup");
    REQUIRE_FALSE(room.quests.SetValue(0.5f).handled);
    REQUIRE_FALSE(room.quests.Evaluate().handled);
    REQUIRE_FALSE(room.quests.Attempt().handled);
    REQUIRE_FALSE(room.quests.Focus().handled);
    REQUIRE_FALSE(room.quests.Rest().handled);
    REQUIRE_FALSE(room.quests.Tick());
}

TEST_CASE("discover quests pass straight through to complete", "[quest]")
{
    Room room;
    REQUIRE(room.quests.Start("book"));
    REQUIRE(room.quests.Stage("book") == QuestStage::Complete);
    REQUIRE(room.ledger.Has(3));
    REQUIRE_FALSE(room.quests.HasActiveChallenge());
    REQUIRE(room.chronicle.Contains("QUEST STARTED // A Quiet Hello"));

    REQUIRE_FALSE(room.quests.Start("book"));
    REQUIRE(room.ledger.Count() == 1);
}

TEST_CASE("abandoning keeps the stage and resuming starts a fresh attempt", "[quest]")
{
    Room room;
    room.quests.Start("teacup");
    room.quests.Place(0);

    room.quests.Abandon();
    REQUIRE_FALSE(room.quests.HasActiveChallenge());
    REQUIRE(room.quests.Stage("teacup") == QuestStage::InProgress);
    REQUIRE_FALSE(room.quests.Place(0).handled);

    REQUIRE(room.quests.Resume("teacup"));
    REQUIRE(room.quests.ActiveId() == "teacup");
    REQUIRE(Shelf(room.quests).placed == 0);
    REQUIRE(room.chronicle.Contains("QUEST RESUMED"));

    REQUIRE_FALSE(room.quests.Resume("toaster"));
    REQUIRE_FALSE(room.quests.Resume("book"));
}

TEST_CASE("seeded drift is reproducible and stays in range", "[quest][drift]")
{
    RandomDrift a(1234);
    RandomDrift b(1234);
    for (int i = 0; i < 100; ++i)
    {
        const float x = a.Next(-0.03f, 0.05f);
        REQUIRE(x == b.Next(-0.03f, 0.05f));
        REQUIRE(x >= -0.03f);
        REQUIRE(x < 0.05f);
    }
    REQUIRE(a.Next(0.2f, 0.2f) == 0.2f);
}
