#pragma once

#include "game_state.h"

#include "raylib.h"

#include <string>
#include <vector>

constexpr int kSceneWidth = 960;
constexpr int kSceneHeight = 540;

enum class HudAction
{
    Continue,
    Close,
    Choice,
    Peek,
    Evaluate,
    ResetHeat,
    Attempt,
    Focus,
    Rest,
    Place
};

struct HudButton
{
    Rectangle area{};
    std::string label;
    HudAction action = HudAction::Continue;
    size_t index = 0;
};

struct HudLayout
{
    Rectangle dialoguePanel{};
    Rectangle challengePanel{};
    Rectangle heatBar{};
    bool showHeatBar = false;
    std::vector<HudButton> buttons;
};

// Button and panel rectangles in scene space, shared by drawing and input.
HudLayout BuildHudLayout(const GameSnapshot &snap);

Camera2D BuildRoomCamera(int screenWidth, int screenHeight);

void DrawRoom(const GameState &game, const GameSnapshot &snap, int frame);
void DrawHud(const GameState &game, const GameSnapshot &snap, const HudLayout &layout, Vector2 mouse);
void DrawDebugOverlay(const GameState &game);
