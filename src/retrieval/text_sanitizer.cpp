#include "docchunk/retrieval/text_sanitizer.hpp"
#include <cstddef>
#include <cstdint>

namespace docchunk
{
namespace retrieval
{

namespace
{
    // Decodes the UTF-8 sequence starting at `pos`. Returns the sequence length,
    // or 0 when the bytes there do not form a well-formed sequence.
    size_t decodeUtf8(const std::string& s, size_t pos, uint32_t& codePoint)
    {
        const auto lead = static_cast<unsigned char>(s[pos]);
        size_t length = 0;
        uint32_t minValue = 0;

        if (lead < 0x80)
        {
            codePoint = lead;
            return 1;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            codePoint = lead & 0x1F;
            minValue = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            codePoint = lead & 0x0F;
            minValue = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            codePoint = lead & 0x07;
            minValue = 0x10000;
        }
        else
        {
            return 0;
        }

        if (pos + length > s.size())
        {
            return 0;
        }

        for (size_t i = 1; i < length; ++i)
        {
            const auto next = static_cast<unsigned char>(s[pos + i]);
            if ((next & 0xC0) != 0x80)
            {
                return 0;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (codePoint < minValue || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
            return 0;
        }
        return length;
    }

    bool isRejectedCodePoint(uint32_t cp)
    {
        if (cp < 0x20)
        {
            return cp != '\n' && cp != '\t';
        }
        if (cp >= 0x7F && cp <= 0x9F)
        {
            return true;
        }
        if (cp >= 0xFDD0 && cp <= 0xFDEF)
        {
            return true;
        }
        return cp == 0xFFFE || cp == 0xFFFF;
    }
}

std::string cleanText(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size())
    {
        if (raw[pos] == '\r')
        {
            out.push_back('\n');
            pos += (pos + 1 < raw.size() && raw[pos + 1] == '\n') ? 2 : 1;
            continue;
        }

        uint32_t codePoint = 0;
        const size_t length = decodeUtf8(raw, pos, codePoint);
        if (length == 0)
        {
            ++pos;
            continue;
        }

        if (!isRejectedCodePoint(codePoint))
        {
            out.append(raw, pos, length);
        }
        pos += length;
    }

    return out;
}

} // namespace retrieval
} // namespace docchunk
