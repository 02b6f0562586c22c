#ifndef DOCCHUNK_CONTENT_TYPES_HPP
#define DOCCHUNK_CONTENT_TYPES_HPP

#include "../export.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Kind of a content item discovered on a slide
 */
enum class ContentKind
{
    Title,
    Text,
    Table,
    Notes,
    Image
};

DOCCHUNK_API const char* contentKindName(ContentKind kind);

/**
 * @brief One typed unit of slide content, in slide-local reading order
 *
 * Text-bearing kinds carry `content`; Image items carry `imageRelId`.
 */
struct ContentItem
{
    ContentKind kind = ContentKind::Text;
    std::string content;
    std::string imageRelId;
    int sequencePosition = 0;
    int slideNumber = 0;

    bool isTextBearing() const
    {
        return kind != ContentKind::Image;
    }
};

/**
 * @brief Chunks produced for one document
 *
 * Text and image chunks share a single position space. The four arrays are
 * parallel pairwise: text_chunks/text_chunk_pos and image_chunks/image_chunk_pos.
 */
struct DOCCHUNK_API ProcessingResult
{
    std::vector<std::string> text_chunks;
    std::vector<std::string> image_chunks;
    std::vector<int> text_chunk_pos;
    std::vector<int> image_chunk_pos;

    bool empty() const
    {
        return text_chunks.empty() && image_chunks.empty();
    }

    /**
     * @brief Checks the parallel-array lengths and that no position is used twice
     */
    bool validate() const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_CONTENT_TYPES_HPP
