#include "game_config.h"

#include "chronicle.h"

#include <algorithm>
#include <fstream>
#include <sstream>

static bool ParseFlag(const std::string &token, bool &out)
{
    if (token == "1" || token == "true" || token == "on")
    {
        out = true;
        return true;
    }
    if (token == "0" || token == "false" || token == "off")
    {
        out = false;
        return true;
    }
    return false;
}

bool LoadConfig(const std::string &path, GameConfig &config, Chronicle &chronicle)
{
    std::ifstream in(path);
    if (!in)
    {
        chronicle.Push("CONFIG", "defaults (" + path + " not found)");
        return true;
    }
    const bool ok = ParseConfig(in, config, chronicle);
    chronicle.Push("CONFIG", ok ? "loaded " + path : "loaded " + path + " with warnings");
    return ok;
}

bool ParseConfig(std::istream &in, GameConfig &config, Chronicle &chronicle)
{
    GameConfig loaded = config;
    bool clean = true;

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line))
    {
        ++lineNumber;
        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key) || key[0] == '#')
        {
            continue;
        }

        bool valid = true;
        if (key == "width" || key == "height" || key == "fps")
        {
            int value = 0;
            valid = static_cast<bool>(iss >> value);
            if (valid && key == "width")
            {
                loaded.screenWidth = std::clamp(value, 320, 7680);
            }
            else if (valid && key == "height")
            {
                loaded.screenHeight = std::clamp(value, 180, 4320);
            }
            else if (valid)
            {
                loaded.targetFps = std::clamp(value, 10, 240);
            }
        }
        else if (key == "max_tick")
        {
            float value = 0.0f;
            valid = static_cast<bool>(iss >> value);
            if (valid)
            {
                loaded.maxTickSeconds = std::clamp(value, 0.001f, 0.25f);
            }
        }
        else if (key == "seed")
        {
            uint32_t value = 0;
            valid = static_cast<bool>(iss >> value);
            if (valid)
            {
                loaded.driftSeed = value;
            }
        }
        else if (key == "muted" || key == "debug")
        {
            std::string token;
            iss >> token;
            valid = ParseFlag(token, key == "muted" ? loaded.muted : loaded.debugVisuals);
        }
        else if (key == "chronicle")
        {
            size_t value = 0;
            valid = static_cast<bool>(iss >> value);
            if (valid)
            {
                loaded.chronicleLines = std::clamp<size_t>(value, 4, 256);
            }
        }
        else
        {
            chronicle.Push("CONFIG WARNING", "unknown key " + key + " at line " + std::to_string(lineNumber));
            clean = false;
            continue;
        }

        if (!valid)
        {
            chronicle.Push("CONFIG WARNING", "bad value for " + key + " at line " + std::to_string(lineNumber));
            clean = false;
        }
    }

    config = loaded;
    return clean;
}
