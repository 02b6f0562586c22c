#include "docchunk/retrieval/content_types.hpp"
#include "docchunk/logger.hpp"
#include <algorithm>

namespace docchunk
{
namespace retrieval
{

const char* contentKindName(ContentKind kind)
{
    switch (kind)
    {
    case ContentKind::Title:
        return "title";
    case ContentKind::Text:
        return "text";
    case ContentKind::Table:
        return "table";
    case ContentKind::Notes:
        return "notes";
    case ContentKind::Image:
        return "image";
    }
    return "unknown";
}

bool ProcessingResult::validate() const
{
    if (text_chunks.size() != text_chunk_pos.size())
    {
        PipelineLogger::logDebug("Validation failed: %zu text chunks but %zu text positions",
                                 text_chunks.size(), text_chunk_pos.size());
        return false;
    }

    if (image_chunks.size() != image_chunk_pos.size())
    {
        PipelineLogger::logDebug("Validation failed: %zu image chunks but %zu image positions",
                                 image_chunks.size(), image_chunk_pos.size());
        return false;
    }

    std::vector<int> merged(text_chunk_pos);
    merged.insert(merged.end(), image_chunk_pos.begin(), image_chunk_pos.end());
    std::sort(merged.begin(), merged.end());
    if (std::adjacent_find(merged.begin(), merged.end()) != merged.end())
    {
        PipelineLogger::logDebug("Validation failed: duplicate chunk position");
        return false;
    }

    return true;
}

nlohmann::json ProcessingResult::to_json() const
{
    nlohmann::json j;
    j["text_chunks"] = text_chunks;
    j["image_chunks"] = image_chunks;
    j["text_chunk_pos"] = text_chunk_pos;
    j["image_chunk_pos"] = image_chunk_pos;
    return j;
}

void ProcessingResult::from_json(const nlohmann::json& j)
{
    if (j.contains("text_chunks") && j["text_chunks"].is_array())
    {
        text_chunks = j["text_chunks"].get<std::vector<std::string>>();
    }

    if (j.contains("image_chunks") && j["image_chunks"].is_array())
    {
        image_chunks = j["image_chunks"].get<std::vector<std::string>>();
    }

    if (j.contains("text_chunk_pos") && j["text_chunk_pos"].is_array())
    {
        text_chunk_pos = j["text_chunk_pos"].get<std::vector<int>>();
    }

    if (j.contains("image_chunk_pos") && j["image_chunk_pos"].is_array())
    {
        image_chunk_pos = j["image_chunk_pos"].get<std::vector<int>>();
    }
}

} // namespace retrieval
} // namespace docchunk
