#include "raylib.h"

#include "game_config.h"
#include "game_state.h"
#include "room_render.h"
#include "tone_cue_sink.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <variant>

static void Dispatch(GameState &game, const HudButton &button)
{
    switch (button.action)
    {
    case HudAction::Continue:
        game.Advance();
        break;
    case HudAction::Close:
        game.Close();
        break;
    case HudAction::Choice:
        game.Choose(button.index);
        break;
    case HudAction::Peek:
        game.PeekHeat();
        break;
    case HudAction::Evaluate:
        game.Evaluate();
        break;
    case HudAction::ResetHeat:
        game.ResetHeat();
        break;
    case HudAction::Attempt:
        game.Attempt();
        break;
    case HudAction::Focus:
        game.Focus();
        break;
    case HudAction::Rest:
        game.Rest();
        break;
    case HudAction::Place:
        game.Place(button.index);
        break;
    default:
        break;
    }
}

static void HandleKeys(GameState &game, const GameSnapshot &snap, GameConfig &config, ToneCueSink &tones)
{
    if (IsKeyPressed(KEY_ESCAPE))
    {
        game.Close();
    }
    if (IsKeyPressed(KEY_M))
    {
        game.Log().Push("AUDIO", tones.ToggleMute() ? "muted" : "unmuted");
    }
    if (IsKeyPressed(KEY_F3))
    {
        config.debugVisuals = !config.debugVisuals;
    }
    if (IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_ENTER))
    {
        game.Advance();
    }
    for (int i = 0; i < 3; ++i)
    {
        if (IsKeyPressed(KEY_ONE + i))
        {
            game.Choose(static_cast<size_t>(i));
        }
    }

    if (!snap.challenge.active)
    {
        return;
    }
    switch (snap.challenge.kind)
    {
    case QuestKind::Calibration:
        if (const auto *cal = std::get_if<CalibrationChallenge>(&snap.challenge.progress))
        {
            if (IsKeyPressed(KEY_LEFT))
            {
                game.SetHeat(cal->value - 0.05f);
            }
            if (IsKeyPressed(KEY_RIGHT))
            {
                game.SetHeat(cal->value + 0.05f);
            }
        }
        if (IsKeyPressed(KEY_T))
        {
            game.Evaluate();
        }
        if (IsKeyPressed(KEY_B))
        {
            game.ResetHeat();
        }
        if (IsKeyPressed(KEY_P))
        {
            game.PeekHeat();
        }
        break;
    case QuestKind::Streak:
        if (IsKeyPressed(KEY_G))
        {
            game.Attempt();
        }
        if (IsKeyPressed(KEY_F))
        {
            game.Focus();
        }
        if (IsKeyPressed(KEY_R))
        {
            game.Rest();
        }
        break;
    default:
        break;
    }
}

static void HandlePointer(GameState &game, const GameSnapshot &snap, const HudLayout &layout, Vector2 mouse)
{
    game.HoverAt(snap.dialogue.open ? Vector2{-1.0f, -1.0f} : mouse);

    if (layout.showHeatBar && IsMouseButtonDown(MOUSE_LEFT_BUTTON))
    {
        const Rectangle grab{layout.heatBar.x - 6.0f, layout.heatBar.y - 8.0f, layout.heatBar.width + 12.0f,
                             layout.heatBar.height + 16.0f};
        const auto *cal = std::get_if<CalibrationChallenge>(&snap.challenge.progress);
        if (cal != nullptr && CheckCollisionPointRec(mouse, grab))
        {
            const float heat = std::clamp((mouse.x - layout.heatBar.x) / layout.heatBar.width, 0.0f, 1.0f);
            if (std::fabs(heat - cal->value) > 0.005f)
            {
                game.SetHeat(heat);
            }
            return;
        }
    }

    if (!IsMouseButtonPressed(MOUSE_LEFT_BUTTON))
    {
        return;
    }

    for (const auto &button : layout.buttons)
    {
        if (CheckCollisionPointRec(mouse, button.area))
        {
            Dispatch(game, button);
            return;
        }
    }

    // Clicks belong to the dialogue UI while it is open.
    if (!snap.dialogue.open)
    {
        game.SelectAt(mouse);
    }
}

int main(int argc, char **argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "pocket_spirits.cfg";

    Chronicle bootLog(32);
    GameConfig config;
    LoadConfig(configPath, config, bootLog);

    GameState game(config);
    for (const auto &line : bootLog.Lines())
    {
        game.Log().Push(line);
    }
    if (!game.Ready())
    {
        TraceLog(LOG_ERROR, "%s", game.Log().Last().c_str());
        return 1;
    }

    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(config.screenWidth, config.screenHeight, "Pocket Spirits");
    SetExitKey(KEY_NULL);
    SetTargetFPS(config.targetFps);
    InitAudioDevice();

    int frameCounter = 0;
    {
        ToneCueSink tones;
        tones.SetMuted(config.muted);
        game.Cues().Attach(&tones);

        while (!WindowShouldClose())
        {
            ++frameCounter;
            const Camera2D camera = BuildRoomCamera(GetScreenWidth(), GetScreenHeight());
            const Vector2 mouse = GetScreenToWorld2D(GetMousePosition(), camera);

            const GameSnapshot before = game.Snapshot();
            const HudLayout inputLayout = BuildHudLayout(before);
            HandleKeys(game, before, config, tones);
            HandlePointer(game, before, inputLayout, mouse);
            game.Tick(GetFrameTime());

            const GameSnapshot snap = game.Snapshot();
            const HudLayout layout = BuildHudLayout(snap);

            BeginDrawing();
            ClearBackground(BLACK);
            BeginMode2D(camera);
            DrawRoom(game, snap, frameCounter);
            DrawHud(game, snap, layout, mouse);
            if (config.debugVisuals)
            {
                DrawDebugOverlay(game);
            }
            EndMode2D();
            EndDrawing();
        }

        game.Cues().Detach(&tones);
    }

    CloseAudioDevice();
    CloseWindow();
    return 0;
}
