#include "chronicle.h"

#include <algorithm>
#include <cstddef>

namespace
{
const std::string kEmpty;
}

Chronicle::Chronicle(size_t maxLines) : maxLines_(std::max<size_t>(1, maxLines))
{
}

void Chronicle::Push(const std::string &line)
{
    if (line.empty())
    {
        return;
    }
    lines_.push_back(line);
    Trim();
}

void Chronicle::Push(const std::string &tag, const std::string &message)
{
    Push(tag + " // " + message);
}

void Chronicle::SetCapacity(size_t maxLines)
{
    maxLines_ = std::max<size_t>(1, maxLines);
    Trim();
}

const std::string &Chronicle::Last() const
{
    return lines_.empty() ? kEmpty : lines_.back();
}

bool Chronicle::Contains(const std::string &fragment) const
{
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string &line) {
        return line.find(fragment) != std::string::npos;
    });
}

void Chronicle::Trim()
{
    if (lines_.size() > maxLines_)
    {
        const size_t overflow = lines_.size() - maxLines_;
        lines_.erase(lines_.begin(), lines_.begin() + static_cast<std::ptrdiff_t>(overflow));
    }
}
