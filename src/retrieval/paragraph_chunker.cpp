#include "docchunk/retrieval/paragraph_chunker.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <stdexcept>

namespace docchunk
{
namespace retrieval
{

ParagraphChunker::ParagraphChunker(int max_chunk_bytes, int overlap_bytes)
    : max_chunk_bytes_(max_chunk_bytes), overlap_bytes_(overlap_bytes)
{
    if (max_chunk_bytes_ <= 0)
    {
        throw std::invalid_argument("max_chunk_bytes must be positive");
    }
    if (overlap_bytes_ < 0)
    {
        throw std::invalid_argument("overlap_bytes cannot be negative");
    }
    if (overlap_bytes_ >= max_chunk_bytes_)
    {
        throw std::invalid_argument("overlap_bytes must be smaller than max_chunk_bytes");
    }
}

std::vector<std::string> ParagraphChunker::splitParagraphs(const std::string& text)
{
    std::vector<std::string> paragraphs;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        std::string paragraph = trim_copy(text.substr(start, end - start));
        if (!paragraph.empty())
        {
            paragraphs.push_back(std::move(paragraph));
        }
        start = end + 1;
    }
    return paragraphs;
}

std::vector<std::string> ParagraphChunker::splitSentences(const std::string& paragraph)
{
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;
    while (i < paragraph.size())
    {
        const char c = paragraph[i];
        if ((c == '.' || c == '!' || c == '?') && i + 1 < paragraph.size() && is_blank_char(paragraph[i + 1]))
        {
            sentences.push_back(paragraph.substr(start, i + 1 - start));
            size_t next = i + 1;
            while (next < paragraph.size() && is_blank_char(paragraph[next]))
            {
                ++next;
            }
            start = next;
            i = next;
            continue;
        }
        ++i;
    }
    if (start < paragraph.size())
    {
        sentences.push_back(paragraph.substr(start));
    }
    return sentences;
}

std::string ParagraphChunker::trailingWords(const std::string& text, size_t max_bytes)
{
    std::vector<std::string> words;
    std::string current;
    for (char c : text)
    {
        if (is_blank_char(c))
        {
            if (!current.empty())
            {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(c);
        }
    }
    if (!current.empty())
    {
        words.push_back(std::move(current));
    }

    std::string overlap;
    size_t used = 0;
    for (auto it = words.rbegin(); it != words.rend(); ++it)
    {
        const size_t cost = it->size() + 1;
        if (used + cost > max_bytes && !overlap.empty())
        {
            break;
        }
        overlap = overlap.empty() ? *it : *it + " " + overlap;
        used += cost;
    }
    return overlap;
}

std::vector<ParagraphChunker::Unit> ParagraphChunker::toUnits(const std::vector<std::string>& paragraphs) const
{
    const size_t limit = static_cast<size_t>(max_chunk_bytes_);
    std::vector<Unit> units;
    for (const auto& paragraph : paragraphs)
    {
        if (paragraph.size() <= limit)
        {
            units.push_back(Unit{paragraph, '\n'});
            continue;
        }

        auto sentences = splitSentences(paragraph);
        for (size_t i = 0; i < sentences.size(); ++i)
        {
            units.push_back(Unit{std::move(sentences[i]), i == 0 ? '\n' : ' '});
        }
    }
    return units;
}

std::vector<std::string> ParagraphChunker::chunk(const std::string& text) const
{
    const size_t limit = static_cast<size_t>(max_chunk_bytes_);
    const size_t overlapLimit = static_cast<size_t>(overlap_bytes_);
    const auto units = toUnits(splitParagraphs(text));

    std::vector<std::string> chunks;
    std::vector<Unit> pending;
    size_t pendingBytes = 0;
    // Whether pending holds anything beyond the overlap seed
    bool fresh = false;

    auto joinedBytes = [](const std::vector<Unit>& list)
    {
        size_t total = 0;
        for (size_t i = 0; i < list.size(); ++i)
        {
            total += list[i].text.size() + (i > 0 ? 1 : 0);
        }
        return total;
    };

    auto emit = [&]()
    {
        std::string out;
        out.reserve(pendingBytes);
        for (size_t i = 0; i < pending.size(); ++i)
        {
            if (i > 0)
            {
                out.push_back(pending[i].separator);
            }
            out += pending[i].text;
        }
        chunks.push_back(std::move(out));
    };

    auto keepOverlapSeed = [&]()
    {
        std::vector<Unit> seed;
        if (overlapLimit > 0)
        {
            size_t used = 0;
            for (auto it = pending.rbegin(); it != pending.rend(); ++it)
            {
                const size_t cost = it->text.size() + (seed.empty() ? 0 : 1);
                if (used + cost > overlapLimit)
                {
                    break;
                }
                seed.insert(seed.begin(), *it);
                used += cost;
            }
        }
        pending = std::move(seed);
        pendingBytes = joinedBytes(pending);
    };

    for (const auto& unit : units)
    {
        const size_t size = unit.text.size();

        if (size > limit)
        {
            if (fresh)
            {
                emit();
            }
            chunks.push_back(unit.text);
            pending.clear();
            pendingBytes = 0;
            fresh = false;
            continue;
        }

        if (!pending.empty() && pendingBytes + 1 + size > limit)
        {
            if (fresh)
            {
                emit();
                keepOverlapSeed();
            }
            fresh = false;
            while (!pending.empty() && pendingBytes + 1 + size > limit)
            {
                pending.erase(pending.begin());
                pendingBytes = joinedBytes(pending);
            }
        }

        pendingBytes += (pending.empty() ? 0 : 1) + size;
        pending.push_back(unit);
        fresh = true;
    }

    if (fresh)
    {
        emit();
    }

    PipelineLogger::logDebug("Chunked %zu bytes into %zu chunks (max %d, overlap %d)",
                             text.size(), chunks.size(), max_chunk_bytes_, overlap_bytes_);
    return chunks;
}

std::vector<std::string> chunkByParagraph(const std::string& text, int max_chunk_bytes, int overlap_bytes)
{
    return ParagraphChunker(max_chunk_bytes, overlap_bytes).chunk(text);
}

} // namespace retrieval
} // namespace docchunk
