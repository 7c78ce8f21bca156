#pragma once

#include "cue.h"

#include "raylib.h"

#include <vector>

// Plays short synthesized blips for core cues through raylib audio. Silent when
// no audio device is available.
class ToneCueSink : public CueSink
{
public:
    ToneCueSink();
    ~ToneCueSink() override;

    ToneCueSink(const ToneCueSink &) = delete;
    ToneCueSink &operator=(const ToneCueSink &) = delete;

    void OnCue(const Cue &cue) override;

    void SetMuted(bool muted) { muted_ = muted; }
    bool ToggleMute() { return muted_ = !muted_; }
    bool Muted() const { return muted_; }

private:
    enum class Shape
    {
        Sine,
        Triangle
    };

    struct Tone
    {
        Sound sound{};
        bool loaded = false;
    };

    Tone Make(float frequency, float seconds, Shape shape, float gain);
    void Play(const Tone &tone);

    bool ready_ = false;
    bool muted_ = false;

    Tone open_;
    Tone close_;
    Tone line_;
    Tone blocked_;
    Tone feedback_;
    Tone success_;
    Tone successHigh_;
    Tone failure_;
    Tone fragment_;
    Tone fragmentHigh_;
    Tone empty_;
    std::vector<Tone> heat_;
};
