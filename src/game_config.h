#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

class Chronicle;

struct GameConfig
{
    int screenWidth = 960;
    int screenHeight = 540;
    int targetFps = 60;
    float maxTickSeconds = 0.033f;
    uint32_t driftSeed = 0;
    bool muted = false;
    bool debugVisuals = false;
    size_t chronicleLines = 16;
};

// Reads "key value" lines into config. A missing file keeps the defaults and
// is not a failure; unknown keys and bad values are reported and skipped.
bool LoadConfig(const std::string &path, GameConfig &config, Chronicle &chronicle);
bool ParseConfig(std::istream &in, GameConfig &config, Chronicle &chronicle);
