#include "tone_cue_sink.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace
{
constexpr unsigned int kSampleRate = 44100;
constexpr int kHeatSteps = 11;
constexpr float kTau = 6.28318530718f;
} // namespace

ToneCueSink::ToneCueSink() : ready_(IsAudioDeviceReady())
{
    if (!ready_)
    {
        return;
    }

    open_ = Make(640.0f, 0.05f, Shape::Sine, 0.3f);
    close_ = Make(420.0f, 0.05f, Shape::Sine, 0.2f);
    line_ = Make(620.0f, 0.04f, Shape::Sine, 0.2f);
    blocked_ = Make(300.0f, 0.03f, Shape::Sine, 0.1f);
    feedback_ = Make(720.0f, 0.04f, Shape::Triangle, 0.2f);
    success_ = Make(980.0f, 0.06f, Shape::Triangle, 0.35f);
    successHigh_ = Make(1220.0f, 0.05f, Shape::Sine, 0.2f);
    failure_ = Make(360.0f, 0.05f, Shape::Sine, 0.2f);
    fragment_ = Make(880.0f, 0.07f, Shape::Triangle, 0.4f);
    fragmentHigh_ = Make(1120.0f, 0.05f, Shape::Sine, 0.3f);
    empty_ = Make(260.0f, 0.03f, Shape::Sine, 0.1f);
    for (int i = 0; i < kHeatSteps; ++i)
    {
        const float heat = static_cast<float>(i) / (kHeatSteps - 1);
        heat_.push_back(Make(520.0f + heat * 380.0f, 0.03f, Shape::Sine, 0.15f));
    }
}

ToneCueSink::~ToneCueSink()
{
    auto unload = [](Tone &tone) {
        if (tone.loaded)
        {
            UnloadSound(tone.sound);
            tone.loaded = false;
        }
    };
    for (Tone *tone : {&open_, &close_, &line_, &blocked_, &feedback_, &success_, &successHigh_, &failure_,
                       &fragment_, &fragmentHigh_, &empty_})
    {
        unload(*tone);
    }
    for (auto &tone : heat_)
    {
        unload(tone);
    }
}

ToneCueSink::Tone ToneCueSink::Make(float frequency, float seconds, Shape shape, float gain)
{
    const unsigned int frames = static_cast<unsigned int>(seconds * kSampleRate);
    std::vector<int16_t> samples(frames);
    const float attack = 0.01f * kSampleRate;
    for (unsigned int i = 0; i < frames; ++i)
    {
        const float phase = std::fmod(frequency * static_cast<float>(i) / kSampleRate, 1.0f);
        const float wave = shape == Shape::Sine ? std::sin(phase * kTau) : 1.0f - 4.0f * std::fabs(phase - 0.5f);
        const float env = std::min(1.0f, static_cast<float>(i) / attack) *
                          std::exp(-4.0f * static_cast<float>(i) / static_cast<float>(frames));
        samples[i] = static_cast<int16_t>(std::clamp(wave * env * gain, -1.0f, 1.0f) * 32767.0f);
    }

    Wave wave{};
    wave.frameCount = frames;
    wave.sampleRate = kSampleRate;
    wave.sampleSize = 16;
    wave.channels = 1;
    wave.data = samples.data();

    Tone tone;
    tone.sound = LoadSoundFromWave(wave);
    tone.loaded = true;
    return tone;
}

void ToneCueSink::Play(const Tone &tone)
{
    if (ready_ && !muted_ && tone.loaded)
    {
        PlaySound(tone.sound);
    }
}

void ToneCueSink::OnCue(const Cue &cue)
{
    switch (cue.kind)
    {
    case CueKind::DialogueOpened:
        Play(open_);
        break;
    case CueKind::DialogueClosed:
        Play(close_);
        break;
    case CueKind::LinePresented:
        Play(line_);
        break;
    case CueKind::AdvanceBlocked:
        Play(blocked_);
        break;
    case CueKind::ChallengeStarted:
    case CueKind::ChallengeFeedback:
        Play(feedback_);
        break;
    case CueKind::ChallengeSucceeded:
        Play(success_);
        Play(successHigh_);
        break;
    case CueKind::ChallengeFailed:
        Play(failure_);
        break;
    case CueKind::FragmentAwarded:
        Play(fragment_);
        Play(fragmentHigh_);
        break;
    case CueKind::EmptyClick:
        Play(empty_);
        break;
    case CueKind::HeatChanged:
        if (!heat_.empty())
        {
            const int step = static_cast<int>(std::lround(std::clamp(cue.value, 0.0f, 1.0f) * (kHeatSteps - 1)));
            Play(heat_[static_cast<size_t>(step)]);
        }
        break;
    default:
        break;
    }
}
