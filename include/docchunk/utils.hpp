#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace docchunk
{

inline bool is_blank_char(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline std::string trim_copy(const std::string& s)
{
    size_t start = 0;
    size_t end = s.size();
    while (start < end && is_blank_char(s[start]))
        ++start;
    while (end > start && is_blank_char(s[end - 1]))
        --end;
    return s.substr(start, end - start);
}

inline std::string to_lower_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Lowercased extension without the dot ("media/Image1.PNG" -> "png"), empty if none
inline std::string file_extension(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) || dot + 1 == path.size())
        return "";
    return to_lower_copy(path.substr(dot + 1));
}

// Collapses every whitespace run to a single space and trims the ends
inline std::string collapse_whitespace(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s)
    {
        if (is_blank_char(c))
        {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace)
        {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace docchunk
