#pragma once

#include "spirit_registry.h"

#include <array>
#include <string>

class Chronicle;

enum class FragmentTier
{
    None,
    Started,
    Deepened
};

enum class AwardResult
{
    NewlyAwarded,
    AlreadyHeld,
    NoSlot
};

struct LedgerSnapshot
{
    std::array<bool, kFragmentSlots> slots{};
    int count = 0;
    float warmth = 0.0f;
    FragmentTier tier = FragmentTier::None;
};

const char *FragmentTierLabel(FragmentTier tier);
FragmentTier TierForCount(int count);

// Collected memory fragments. Slots only ever flip false -> true, and warmth
// only grows.
class FragmentLedger
{
public:
    static constexpr float kWarmthStep = 0.18f;

    explicit FragmentLedger(Chronicle &chronicle);

    AwardResult Award(int slotIndex);

    bool Has(int slotIndex) const;
    int Count() const { return count_; }
    float Warmth() const { return warmth_; }
    FragmentTier Tier() const { return TierForCount(count_); }
    LedgerSnapshot Snapshot() const;

    static const std::string &TierNote(FragmentTier tier);

private:
    Chronicle &chronicle_;
    std::array<bool, kFragmentSlots> slots_{};
    int count_ = 0;
    float warmth_ = 0.0f;
};
