#include "room_render.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <variant>

static unsigned char U8(int value)
{
    return static_cast<unsigned char>(std::clamp(value, 0, 255));
}

static uint32_t HashNoise(int x, int y, int frame)
{
    uint32_t h = static_cast<uint32_t>(x) * 374761393u;
    h += static_cast<uint32_t>(y) * 668265263u;
    h += static_cast<uint32_t>(frame) * 2246822519u;
    h = (h ^ (h >> 13u)) * 1274126177u;
    return h ^ (h >> 16u);
}

static Color Shade(Color c, float k)
{
    return Color{U8(static_cast<int>(c.r * k)), U8(static_cast<int>(c.g * k)), U8(static_cast<int>(c.b * k)), c.a};
}

static std::vector<std::string> WrapText(const std::string &text, int fontSize, int maxWidth)
{
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word;
    std::string current;
    while (words >> word)
    {
        const std::string candidate = current.empty() ? word : current + " " + word;
        if (!current.empty() && MeasureText(candidate.c_str(), fontSize) > maxWidth)
        {
            lines.push_back(current);
            current = word;
        }
        else
        {
            current = candidate;
        }
    }
    if (!current.empty())
    {
        lines.push_back(current);
    }
    return lines;
}

static int DrawWrapped(const std::string &text, int x, int y, int fontSize, int maxWidth, Color color)
{
    for (const auto &line : WrapText(text, fontSize, maxWidth))
    {
        DrawText(line.c_str(), x, y, fontSize, color);
        y += fontSize + 4;
    }
    return y;
}

Camera2D BuildRoomCamera(int screenWidth, int screenHeight)
{
    const float zoom = std::min(static_cast<float>(screenWidth) / kSceneWidth,
                                static_cast<float>(screenHeight) / kSceneHeight);
    Camera2D camera{};
    camera.target = Vector2{kSceneWidth * 0.5f, kSceneHeight * 0.5f};
    camera.offset = Vector2{screenWidth * 0.5f, screenHeight * 0.5f};
    camera.rotation = 0.0f;
    camera.zoom = zoom;
    return camera;
}

HudLayout BuildHudLayout(const GameSnapshot &snap)
{
    HudLayout layout;
    if (!snap.dialogue.open)
    {
        return layout;
    }

    layout.dialoguePanel = Rectangle{40.0f, 392.0f, 880.0f, 136.0f};
    const Rectangle &panel = layout.dialoguePanel;
    layout.buttons.push_back(HudButton{Rectangle{panel.x + panel.width - 34.0f, panel.y + 8.0f, 24.0f, 22.0f},
                                       "x", HudAction::Close, 0});

    float bx = panel.x + 16.0f;
    const float by = panel.y + panel.height - 36.0f;
    for (size_t i = 0; i < snap.dialogue.choices.size(); ++i)
    {
        const std::string &label = snap.dialogue.choices[i];
        const float w = static_cast<float>(MeasureText(label.c_str(), 16)) + 24.0f;
        layout.buttons.push_back(HudButton{Rectangle{bx, by, w, 26.0f}, label, HudAction::Choice, i});
        bx += w + 10.0f;
    }
    if (!snap.dialogue.locked)
    {
        layout.buttons.push_back(HudButton{Rectangle{panel.x + panel.width - 120.0f, by, 104.0f, 26.0f},
                                           snap.dialogue.choices.empty() ? "Continue" : "...", HudAction::Continue, 0});
    }

    if (!snap.challenge.active)
    {
        return layout;
    }

    layout.challengePanel = Rectangle{560.0f, 150.0f, 360.0f, 230.0f};
    const Rectangle &cp = layout.challengePanel;
    const float rowY = cp.y + cp.height - 40.0f;
    auto addAction = [&](const std::string &label, HudAction action, size_t index, float x) {
        layout.buttons.push_back(HudButton{Rectangle{x, rowY, 104.0f, 28.0f}, label, action, index});
    };

    switch (snap.challenge.kind)
    {
    case QuestKind::Calibration:
        layout.showHeatBar = true;
        layout.heatBar = Rectangle{cp.x + 24.0f, cp.y + 92.0f, cp.width - 48.0f, 18.0f};
        addAction("Toast", HudAction::Evaluate, 0, cp.x + 12.0f);
        addAction("Breathe", HudAction::ResetHeat, 0, cp.x + 128.0f);
        addAction("Peek", HudAction::Peek, 0, cp.x + 244.0f);
        break;
    case QuestKind::Streak:
        addAction("Glow", HudAction::Attempt, 0, cp.x + 12.0f);
        addAction("Focus", HudAction::Focus, 0, cp.x + 128.0f);
        addAction("Rest", HudAction::Rest, 0, cp.x + 244.0f);
        break;
    case QuestKind::Threshold:
        for (size_t i = 0; i < snap.challenge.placements.size() && i < 3; ++i)
        {
            std::string label = snap.challenge.placements[i];
            const size_t space = label.find(' ');
            if (space != std::string::npos)
            {
                label = label.substr(space + 1);
            }
            addAction(label, HudAction::Place, i, cp.x + 12.0f + static_cast<float>(i) * 116.0f);
        }
        break;
    default:
        break;
    }
    return layout;
}

static void DrawRoomShell(const GameSnapshot &snap)
{
    DrawRectangleGradientV(0, 0, kSceneWidth, kSceneHeight, Color{38, 52, 74, 255}, Color{92, 74, 66, 255});
    DrawCircleGradient(120, 90, 180.0f, Color{255, 240, 200, 30}, BLANK);

    DrawRectangle(0, 420, kSceneWidth, 120, Color{42, 28, 18, 255});
    for (int x = 0; x < kSceneWidth; x += 18)
    {
        DrawRectangle(x, 420, 9, 6, Color{31, 20, 13, 255});
    }

    const Rectangle house{110.0f, 90.0f, 740.0f, 350.0f};
    DrawRectangleRec(house, Color{58, 38, 24, 255});
    for (int y = static_cast<int>(house.y) + 12; y < house.y + house.height; y += 22)
    {
        DrawLine(static_cast<int>(house.x), y, static_cast<int>(house.x + house.width), y, Color{46, 30, 19, 255});
    }
    DrawRectangleLinesEx(house, 4.0f, Color{34, 22, 14, 255});

    // Window with sky
    DrawRectangle(420, 130, 140, 96, Color{140, 184, 214, 255});
    DrawRectangleLinesEx(Rectangle{420.0f, 130.0f, 140.0f, 96.0f}, 6.0f, Color{92, 62, 38, 255});
    DrawLine(490, 130, 490, 226, Color{92, 62, 38, 255});

    // Shelf and table
    DrawRectangle(680, 264, 130, 10, Color{110, 72, 44, 255});
    DrawRectangle(540, 370, 160, 12, Color{120, 80, 48, 255});
    DrawRectangle(552, 382, 10, 38, Color{96, 62, 38, 255});
    DrawRectangle(678, 382, 10, 38, Color{96, 62, 38, 255});

    const float warmAlpha = 0.18f + snap.ledger.warmth * 0.10f;
    DrawRectangleGradientV(100, 80, 760, 380, Fade(Color{255, 214, 167, 255}, warmAlpha * 0.6f),
                           Fade(Color{230, 138, 86, 255}, warmAlpha * 0.3f));
}

static void DrawProp(const SpiritObject &object, bool hovered, bool complete, float t)
{
    const Rectangle b = object.bounds;
    DrawRectangleRec(b, Shade(object.colorB, 0.55f));
    DrawRectangleRec(Rectangle{b.x + 4.0f, b.y + 4.0f, b.width - 8.0f, b.height * 0.35f}, Shade(object.colorA, 0.7f));
    DrawRectangleLinesEx(b, 2.0f, Shade(object.colorB, 0.35f));

    const Vector2 center{b.x + b.width * 0.5f, b.y + b.height * 0.5f};
    if (hovered)
    {
        const float pulse = 0.5f + 0.5f * std::sin(t * 4.0f);
        DrawCircleGradient(static_cast<int>(center.x), static_cast<int>(center.y), 60.0f + pulse * 8.0f,
                           Fade(object.colorA, 0.35f), BLANK);
        DrawRectangleLinesEx(Rectangle{b.x - 3.0f, b.y - 3.0f, b.width + 6.0f, b.height + 6.0f}, 2.0f,
                             Fade(object.colorA, 0.6f + pulse * 0.3f));
    }

    if (complete)
    {
        const float bob = std::sin(t * 2.2f + b.x) * 3.0f;
        const int sx = static_cast<int>(center.x) - 9;
        const int sy = static_cast<int>(b.y - 26.0f + bob);
        DrawCircleGradient(sx + 9, sy + 10, 34.0f, Fade(Color{255, 220, 170, 255}, 0.2f), BLANK);
        DrawRectangle(sx + 4, sy + 6, 10, 10, object.colorA);
        DrawRectangle(sx + 6, sy + 4, 6, 14, object.colorA);
        DrawRectangle(sx + 6, sy + 8, 6, 6, object.colorB);
        DrawRectangle(sx + 7, sy + 9, 2, 2, Color{26, 15, 11, 255});
        DrawRectangle(sx + 11, sy + 9, 2, 2, Color{26, 15, 11, 255});
        DrawText(object.icon.c_str(), sx + 20, sy, 12, object.colorA);
    }
}

static void DrawMotes(int frame)
{
    for (int i = 0; i < 120; ++i)
    {
        const uint32_t n = HashNoise(i * 23, frame / 3 + i * 11, frame / 3);
        const int x = 110 + static_cast<int>(n % 740u);
        const int y = 90 + static_cast<int>((n / 31u) % 330u);
        if ((n & 15u) == 0u)
        {
            DrawCircle(x, y, 1.2f, Color{255, 226, 180, 40});
        }
    }
}

void DrawRoom(const GameState &game, const GameSnapshot &snap, int frame)
{
    DrawRoomShell(snap);
    DrawMotes(frame);
    for (const auto &view : snap.spirits)
    {
        if (const SpiritObject *object = game.Registry().Find(view.id))
        {
            DrawProp(*object, view.hovered, view.complete, snap.clock);
        }
    }
}

static void DrawButton(const HudButton &button, Vector2 mouse)
{
    const bool hover = CheckCollisionPointRec(mouse, button.area);
    DrawRectangleRec(button.area, hover ? Color{96, 72, 56, 235} : Color{58, 44, 36, 225});
    DrawRectangleLinesEx(button.area, 1.4f, Color{230, 196, 150, 200});
    DrawText(button.label.c_str(), static_cast<int>(button.area.x + 12.0f), static_cast<int>(button.area.y + 5.0f), 16,
             Color{250, 236, 214, 255});
}

static void DrawFragments(const GameSnapshot &snap)
{
    const Rectangle panel{12.0f, 12.0f, 300.0f, 70.0f};
    DrawRectangleRec(panel, Color{20, 14, 12, 190});
    DrawRectangleLinesEx(panel, 1.2f, Color{200, 160, 120, 160});
    DrawText(TextFormat("Fragments %d", snap.ledger.count), 22, 18, 16, Color{255, 214, 160, 255});
    for (int i = 0; i < kFragmentSlots; ++i)
    {
        const bool found = snap.ledger.slots[static_cast<size_t>(i)];
        const Rectangle slot{22.0f + static_cast<float>(i) * 23.0f, 40.0f, 18.0f, 18.0f};
        DrawRectangleRec(slot, found ? Color{255, 206, 130, 255} : Color{60, 46, 38, 255});
        DrawRectangleLinesEx(slot, 1.0f, Color{120, 92, 70, 255});
    }
    DrawRectangle(22, 62, static_cast<int>(snap.ledger.warmth * 276.0f), 4, Color{240, 150, 90, 220});
    DrawWrapped(snap.tierNote, 330, 16, 14, 600, Color{240, 226, 206, 230});
}

static void DrawChallenge(const GameSnapshot &snap, const HudLayout &layout)
{
    const ChallengeView &c = snap.challenge;
    const Rectangle &cp = layout.challengePanel;
    DrawRectangleRec(cp, Color{26, 18, 16, 236});
    DrawRectangleLinesEx(cp, 1.6f, Color{230, 180, 120, 210});
    DrawText(c.title.c_str(), static_cast<int>(cp.x + 14.0f), static_cast<int>(cp.y + 12.0f), 20,
             Color{255, 214, 160, 255});

    const int tx = static_cast<int>(cp.x + 14.0f);
    const int ty = static_cast<int>(cp.y + 44.0f);
    if (const auto *cal = std::get_if<CalibrationChallenge>(&c.progress))
    {
        DrawText("cool", tx, ty + 26, 14, Color{150, 190, 230, 255});
        DrawText("hot", static_cast<int>(cp.x + cp.width - 40.0f), ty + 26, 14, Color{240, 130, 90, 255});
        const Rectangle &bar = layout.heatBar;
        DrawRectangleGradientH(static_cast<int>(bar.x), static_cast<int>(bar.y), static_cast<int>(bar.width),
                               static_cast<int>(bar.height), Color{110, 150, 200, 255}, Color{230, 90, 60, 255});
        const float bandX = bar.x + bar.width * c.bandMin;
        const float bandW = bar.width * (c.bandMax - c.bandMin);
        DrawRectangleLinesEx(Rectangle{bandX, bar.y - 3.0f, bandW, bar.height + 6.0f}, 1.0f, Fade(WHITE, 0.4f));
        const float knob = bar.x + bar.width * cal->value;
        DrawRectangle(static_cast<int>(knob) - 3, static_cast<int>(bar.y) - 5, 6, static_cast<int>(bar.height) + 10,
                      Color{255, 244, 220, 255});
        DrawText(TextFormat("heat %d%%", static_cast<int>(std::lround(cal->value * 100.0f))), tx,
                 static_cast<int>(bar.y + 26.0f), 14, Color{230, 220, 200, 255});
    }
    else if (const auto *streak = std::get_if<StreakChallenge>(&c.progress))
    {
        const Rectangle bar{cp.x + 24.0f, cp.y + 70.0f, cp.width - 48.0f, 14.0f};
        DrawRectangleRec(bar, Color{50, 40, 34, 255});
        const Color wobbleColor = streak->instability < c.steadyBelow ? Color{255, 236, 170, 255} : Color{200, 120, 90, 255};
        DrawRectangle(static_cast<int>(bar.x), static_cast<int>(bar.y),
                      static_cast<int>(bar.width * streak->instability), static_cast<int>(bar.height), wobbleColor);
        const int steadyMark = static_cast<int>(bar.x + bar.width * c.steadyBelow);
        DrawLine(steadyMark, static_cast<int>(bar.y) - 4, steadyMark, static_cast<int>(bar.y + bar.height) + 4, WHITE);
        DrawText(TextFormat("steady %d/%d   glow %d/%d", std::min(streak->steadyStreak, c.minStreak), c.minStreak,
                            streak->progress, streak->target),
                 tx, ty + 50, 16, Color{230, 220, 200, 255});
    }
    else if (const auto *shelf = std::get_if<ThresholdChallenge>(&c.progress))
    {
        DrawText(TextFormat("comforts placed %d/%d", shelf->placed, shelf->target), tx, ty + 20, 16,
                 Color{230, 220, 200, 255});
        for (int i = 0; i < shelf->target; ++i)
        {
            const Color slot = i < shelf->placed ? Color{255, 214, 180, 255} : Color{70, 56, 48, 255};
            DrawRectangle(tx + i * 28, ty + 48, 20, 20, slot);
        }
    }

    if (!c.feedback.empty())
    {
        DrawWrapped(c.feedback, tx, static_cast<int>(cp.y + 140.0f), 14, static_cast<int>(cp.width) - 28,
                    Color{250, 236, 214, 230});
    }
}

void DrawHud(const GameState &game, const GameSnapshot &snap, const HudLayout &layout, Vector2 mouse)
{
    DrawFragments(snap);

    if (!snap.discoveredAny)
    {
        const float alpha = 0.75f + std::sin(snap.clock * 2.0f) * 0.15f;
        const char *tap = "Tap an object to look closer";
        DrawText(tap, (kSceneWidth - MeasureText(tap, 20)) / 2, 452, 20, Fade(Color{255, 236, 210, 255}, alpha));
    }

    if (!snap.dialogue.open)
    {
        if (!snap.hint.empty())
        {
            DrawText(snap.hint.c_str(), (kSceneWidth - MeasureText(snap.hint.c_str(), 16)) / 2, 486, 16,
                     Color{255, 236, 210, 220});
        }
        return;
    }

    const Rectangle &panel = layout.dialoguePanel;
    DrawRectangleRec(panel, Color{22, 16, 14, 232});
    DrawRectangleLinesEx(panel, 1.6f, Color{230, 196, 150, 200});

    if (const SpiritObject *object = game.Registry().Find(snap.dialogue.objectId))
    {
        const Rectangle portrait{panel.x + 14.0f, panel.y + 14.0f, 48.0f, 48.0f};
        DrawRectangleGradientV(static_cast<int>(portrait.x), static_cast<int>(portrait.y),
                               static_cast<int>(portrait.width), static_cast<int>(portrait.height),
                               Fade(object->colorA, 0.5f), Fade(object->colorB, 0.3f));
        DrawText(object->icon.c_str(), static_cast<int>(portrait.x + 14.0f), static_cast<int>(portrait.y + 14.0f), 20,
                 RAYWHITE);
    }
    DrawText(snap.dialogue.name.c_str(), static_cast<int>(panel.x + 74.0f), static_cast<int>(panel.y + 12.0f), 18,
             Color{255, 214, 160, 255});
    DrawWrapped(snap.dialogue.line, static_cast<int>(panel.x + 74.0f), static_cast<int>(panel.y + 38.0f), 16,
                static_cast<int>(panel.width) - 120, Color{250, 240, 226, 255});

    if (snap.challenge.active)
    {
        DrawChallenge(snap, layout);
    }
    for (const auto &button : layout.buttons)
    {
        DrawButton(button, mouse);
    }
}

void DrawDebugOverlay(const GameState &game)
{
    for (const auto &o : game.Registry().Objects())
    {
        DrawRectangleLinesEx(o.bounds, 1.0f, Color{120, 255, 160, 200});
        DrawText(o.id.c_str(), static_cast<int>(o.bounds.x), static_cast<int>(o.bounds.y) - 12, 10,
                 Color{120, 255, 160, 220});
    }

    const auto &lines = game.Log().Lines();
    int y = 100;
    DrawRectangle(10, y - 6, 420, static_cast<int>(lines.size()) * 14 + 12, Color{0, 0, 0, 170});
    for (const auto &line : lines)
    {
        DrawText(line.c_str(), 16, y, 10, Color{190, 230, 200, 255});
        y += 14;
    }
    DrawText(TextFormat("dialogue %s", DialogueStateLabel(game.Dialogue().State())), 16, y + 4, 10, YELLOW);
}
