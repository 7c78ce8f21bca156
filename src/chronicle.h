#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Bounded in-memory log of "TAG // message" lines.
class Chronicle
{
public:
    explicit Chronicle(size_t maxLines = 16);

    void Push(const std::string &line);
    void Push(const std::string &tag, const std::string &message);

    void SetCapacity(size_t maxLines);
    size_t Capacity() const { return maxLines_; }

    const std::vector<std::string> &Lines() const { return lines_; }
    const std::string &Last() const;
    bool Contains(const std::string &fragment) const;
    void Clear() { lines_.clear(); }

private:
    void Trim();

    size_t maxLines_;
    std::vector<std::string> lines_;
};
