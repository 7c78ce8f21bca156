#include "spirit_registry.h"

#include <unordered_set>
#include <utility>

const char *QuestKindLabel(QuestKind kind)
{
    switch (kind)
    {
    case QuestKind::None:
        return "None";
    case QuestKind::Discover:
        return "Discover";
    case QuestKind::Calibration:
        return "Calibration";
    case QuestKind::Streak:
        return "Streak";
    case QuestKind::Threshold:
        return "Threshold";
    default:
        return "Unknown";
    }
}

bool IsInteractive(QuestKind kind)
{
    return kind == QuestKind::Calibration || kind == QuestKind::Streak || kind == QuestKind::Threshold;
}

SpiritRegistry::SpiritRegistry(std::vector<SpiritObject> objects) : objects_(std::move(objects))
{
}

bool SpiritRegistry::Validate(const std::vector<SpiritObject> &objects, std::string &error)
{
    std::unordered_set<std::string> ids;
    std::unordered_set<int> slots;
    for (const auto &o : objects)
    {
        if (o.id.empty())
        {
            error = "spirit with empty id";
            return false;
        }
        if (!ids.insert(o.id).second)
        {
            error = "duplicate spirit id " + o.id;
            return false;
        }
        if (o.fragmentSlot < 0)
        {
            continue;
        }
        if (o.fragmentSlot >= kFragmentSlots)
        {
            error = "fragment slot out of range for " + o.id;
            return false;
        }
        if (!slots.insert(o.fragmentSlot).second)
        {
            error = "fragment slot shared by " + o.id;
            return false;
        }
    }
    return true;
}

const SpiritObject *SpiritRegistry::Find(const std::string &id) const
{
    for (const auto &o : objects_)
    {
        if (o.id == id)
        {
            return &o;
        }
    }
    return nullptr;
}

const SpiritObject *SpiritRegistry::Pick(Vector2 point) const
{
    for (const auto &o : objects_)
    {
        if (CheckCollisionPointRec(point, o.bounds))
        {
            return &o;
        }
    }
    return nullptr;
}

SpiritRegistry SpiritRegistry::DefaultRoom()
{
    std::vector<SpiritObject> room;

    SpiritObject toaster;
    toaster.id = "toaster";
    toaster.name = "Bramble the Toaster Spirit";
    toaster.bounds = Rectangle{575.0f, 312.0f, 90.0f, 58.0f};
    toaster.hint = "A toaster sits quietly... but it feels a little tense.";
    toaster.mood = "anxious";
    toaster.icon = "<3";
    toaster.colorA = Color{255, 212, 138, 255};
    toaster.colorB = Color{230, 138, 86, 255};
    toaster.fragmentSlot = 0;
    toaster.script.intro = {
        "...oh! You can see me?",
        "I'm Bramble. I live in warm coils and tiny crumbs.",
        "I'm supposed to toast bread, but... what if I burn it?",
        "Burnt bread smells like disappointment."};
    toaster.script.after = {
        "Thank you for staying with me.",
        "I can do warmth without fear."};
    toaster.quest.kind = QuestKind::Calibration;
    toaster.quest.title = "Toaster Courage";
    toaster.quest.brief = "Bramble worries about burning bread. Set a gentle heat.";
    toaster.quest.companionLabel = "Stay with Bramble";
    {
        CalibrationSpec &c = toaster.quest.calibration;
        c.initial = 0.5f;
        c.bandMin = 0.42f;
        c.bandMax = 0.62f;
        c.peekBelow = "It's pale... like it never got a chance to be brave.";
        c.peekAbove = "It's getting too intense. Bramble's coils tense up.";
        c.peekWithin = "That's a cozy warmth. Golden edges. Gentle confidence.";
        c.belowLine = "The toast is underdone. Bramble whispers: \"I can try again... gently.\"";
        c.aboveLine = "A harsh smell threatens. You stop in time. Bramble trembles, then calms.";
        c.withinLine = "Perfect. Warm. Safe. Bramble's fear softens into pride.";
        c.resetLine = "You both take a slow breath. Crumbs settle like tiny snow.";
    }
    room.push_back(toaster);

    SpiritObject lamp;
    lamp.id = "lamp";
    lamp.name = "Luma the Lamp Spirit";
    lamp.bounds = Rectangle{292.0f, 228.0f, 74.0f, 132.0f};
    lamp.hint = "A standing lamp. It looks like it wants to perform.";
    lamp.mood = "shy";
    lamp.icon = "*";
    lamp.colorA = Color{255, 244, 201, 255};
    lamp.colorB = Color{240, 180, 107, 255};
    lamp.fragmentSlot = 1;
    lamp.script.intro = {
        "Hi... I'm Luma.",
        "I love lighting up rooms.",
        "But when people look at me, I... flicker.",
        "Could you help me practice? Just a little glow. Together."};
    lamp.script.after = {
        "I did it. I didn't run away into dimness.",
        "Your attention felt... gentle."};
    lamp.quest.kind = QuestKind::Streak;
    lamp.quest.title = "Lamp Practice";
    lamp.quest.brief = "Luma gets stage fright. Glow on cue three times, when the little star feels steady.";
    lamp.quest.companionLabel = "Cheer for Luma";
    {
        StreakSpec &s = lamp.quest.streak;
        s.focusLine = "You hold your attention softly. The light steadies.";
        s.successLine = "A clean, confident glow!";
        s.failureLine = "A nervous flicker. That's okay. Try again when it feels steady.";
        s.restLine = "You pause. Stage fright loosens when nobody rushes it.";
    }
    room.push_back(lamp);

    SpiritObject teacup;
    teacup.id = "teacup";
    teacup.name = "Mallow the Teacup Spirit";
    teacup.bounds = Rectangle{712.0f, 208.0f, 62.0f, 56.0f};
    teacup.hint = "A teacup on the shelf. Something inside is listening.";
    teacup.mood = "lonely";
    teacup.icon = "~";
    teacup.colorA = Color{214, 201, 255, 255};
    teacup.colorB = Color{255, 202, 212, 255};
    teacup.fragmentSlot = 2;
    teacup.script.intro = {
        "Oh... hello.",
        "I'm Mallow. I live in little rings of porcelain.",
        "I'm up here all day. It gets... quiet.",
        "Could we make this shelf feel less alone?"};
    teacup.script.after = {
        "It's not the noise I wanted... it's the company.",
        "Thank you for making space for me."};
    teacup.quest.kind = QuestKind::Threshold;
    teacup.quest.title = "A Less-Lonely Shelf";
    teacup.quest.brief = "Mallow feels lonely. Place two tiny comforts on the shelf.";
    teacup.quest.companionLabel = "Sit with Mallow";
    teacup.quest.threshold.target = 2;
    teacup.quest.threshold.placements = {"A sugar cube", "A spoon", "A cookie"};
    teacup.quest.threshold.placedLine = "placed. The shelf feels a little kinder.";
    room.push_back(teacup);

    SpiritObject book;
    book.id = "book";
    book.name = "Sable the Book Spirit";
    book.bounds = Rectangle{184.0f, 214.0f, 78.0f, 82.0f};
    book.hint = "Books breathe when nobody's looking.";
    book.mood = "curious";
    book.icon = "#";
    book.colorA = Color{188, 231, 214, 255};
    book.colorB = Color{131, 179, 255, 255};
    book.fragmentSlot = 3;
    book.script.intro = {
        "I'm Sable, a story folded into paper.",
        "Every time you open a page, I stretch my little legs.",
        "Come back later. I'll have a memory to share."};
    book.script.after = {"Books remember hands. Softly. Kindly."};
    book.quest.kind = QuestKind::Discover;
    book.quest.title = "A Quiet Hello";
    book.quest.companionLabel = "Leave them a quiet moment";
    room.push_back(book);

    SpiritObject plant;
    plant.id = "plant";
    plant.name = "Sprig the Plant Spirit";
    plant.bounds = Rectangle{84.0f, 288.0f, 92.0f, 108.0f};
    plant.hint = "A plant that seems... proud of its leaves.";
    plant.mood = "steady";
    plant.icon = "&";
    plant.colorA = Color{188, 231, 214, 255};
    plant.colorB = Color{255, 212, 138, 255};
    plant.fragmentSlot = 4;
    plant.script.intro = {
        "Hi. I'm Sprig.",
        "I'm learning patience from sunlight.",
        "If you ever forget to breathe, watch leaves. They never hurry."};
    plant.script.after = {"Small days are still days worth living."};
    plant.quest.kind = QuestKind::Discover;
    plant.quest.title = "A Quiet Hello";
    plant.quest.companionLabel = "Leave them a quiet moment";
    room.push_back(plant);

    return SpiritRegistry(std::move(room));
}
