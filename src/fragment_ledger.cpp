#include "fragment_ledger.h"

#include "chronicle.h"

#include <algorithm>

const char *FragmentTierLabel(FragmentTier tier)
{
    switch (tier)
    {
    case FragmentTier::None:
        return "None";
    case FragmentTier::Started:
        return "Started";
    case FragmentTier::Deepened:
        return "Deepened";
    default:
        return "Unknown";
    }
}

FragmentTier TierForCount(int count)
{
    if (count >= 3)
    {
        return FragmentTier::Deepened;
    }
    if (count >= 1)
    {
        return FragmentTier::Started;
    }
    return FragmentTier::None;
}

FragmentLedger::FragmentLedger(Chronicle &chronicle) : chronicle_(chronicle)
{
}

AwardResult FragmentLedger::Award(int slotIndex)
{
    if (slotIndex < 0 || slotIndex >= kFragmentSlots)
    {
        return AwardResult::NoSlot;
    }
    if (slots_[static_cast<size_t>(slotIndex)])
    {
        return AwardResult::AlreadyHeld;
    }

    const FragmentTier before = Tier();
    slots_[static_cast<size_t>(slotIndex)] = true;
    ++count_;
    warmth_ = std::clamp(warmth_ + kWarmthStep, 0.0f, 1.0f);

    chronicle_.Push("FRAGMENT GAINED", TextFormat("slot %d (%d/%d)", slotIndex, count_, kFragmentSlots));
    if (Tier() != before)
    {
        chronicle_.Push("ROOM SHIFT", FragmentTierLabel(Tier()));
    }
    return AwardResult::NewlyAwarded;
}

bool FragmentLedger::Has(int slotIndex) const
{
    if (slotIndex < 0 || slotIndex >= kFragmentSlots)
    {
        return false;
    }
    return slots_[static_cast<size_t>(slotIndex)];
}

LedgerSnapshot FragmentLedger::Snapshot() const
{
    LedgerSnapshot snap;
    snap.slots = slots_;
    snap.count = count_;
    snap.warmth = warmth_;
    snap.tier = Tier();
    return snap;
}

const std::string &FragmentLedger::TierNote(FragmentTier tier)
{
    static const std::string kNone =
        "Find spirits inside everyday objects. Help them with small, wholesome worries.";
    static const std::string kStarted =
        "You've started collecting tiny memories. They feel like warm dust in sunbeams.";
    static const std::string kDeepened =
        "The room feels warmer now. The objects don't feel like objects; they feel like neighbors. "
        "You notice the quiet has a heartbeat.";

    switch (tier)
    {
    case FragmentTier::Started:
        return kStarted;
    case FragmentTier::Deepened:
        return kDeepened;
    case FragmentTier::None:
    default:
        return kNone;
    }
}
