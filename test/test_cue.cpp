#include "test_support.h"

#include <catch2/catch.hpp>

TEST_CASE("cue bus delivers to every attached sink once", "[cue]")
{
    Chronicle log;
    CueBus bus(log);
    RecordingSink a;
    RecordingSink b;
    bus.Attach(&a);
    bus.Attach(&a);
    bus.Attach(&b);

    bus.Emit(CueKind::LinePresented, "lamp", "Hi... I'm Luma.");

    REQUIRE(a.cues.size() == 1);
    REQUIRE(b.cues.size() == 1);
    REQUIRE(a.cues[0].objectId == "lamp");
    REQUIRE(a.cues[0].text == "Hi... I'm Luma.");

    bus.Detach(&a);
    bus.Emit(CueKind::EmptyClick, "");
    REQUIRE(a.cues.size() == 1);
    REQUIRE(b.cues.size() == 2);
}

TEST_CASE("a failing sink is logged and does not stop delivery", "[cue]")
{
    Chronicle log;
    CueBus bus(log);
    ThrowingSink broken;
    RecordingSink healthy;
    bus.Attach(&broken);
    bus.Attach(&healthy);

    REQUIRE_NOTHROW(bus.Emit(CueKind::FragmentAwarded, "book"));
    REQUIRE(healthy.Count(CueKind::FragmentAwarded) == 1);
    REQUIRE(log.Contains("CUE SINK FAILED // FragmentAwarded speaker unplugged"));
}

TEST_CASE("chronicle sink records dialogue and attempts", "[cue]")
{
    Chronicle log;
    ChronicleCueSink sink(log);
    Cue cue;
    cue.kind = CueKind::DialogueOpened;
    cue.objectId = "teacup";
    sink.OnCue(cue);
    cue.kind = CueKind::ChallengeFailed;
    sink.OnCue(cue);
    cue.kind = CueKind::LinePresented;
    sink.OnCue(cue);

    REQUIRE(log.Lines().size() == 2);
    REQUIRE(log.Lines()[0] == "DIALOGUE OPEN // teacup");
    REQUIRE(log.Lines()[1] == "ATTEMPT MISSED // teacup");
}
