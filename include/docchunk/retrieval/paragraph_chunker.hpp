#ifndef DOCCHUNK_PARAGRAPH_CHUNKER_HPP
#define DOCCHUNK_PARAGRAPH_CHUNKER_HPP

#include "../export.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Splits sanitized text into chunks bounded by UTF-8 byte length
 *
 * Paragraphs (runs separated by one or more newlines) are packed into a
 * chunk until the next one would exceed the byte budget. When a chunk is
 * closed, its trailing paragraphs that fit in the overlap budget seed the
 * next chunk. A paragraph larger than the budget is packed sentence by
 * sentence instead; a sentence larger than the budget is emitted whole as
 * its own chunk.
 *
 * Byte lengths are used rather than code points because the index enforces
 * the same limit byte for byte.
 */
class DOCCHUNK_API ParagraphChunker
{
public:
    /**
     * @brief Constructor
     *
     * @param max_chunk_bytes Byte budget per chunk, must be positive
     * @param overlap_bytes Trailing bytes carried into the next chunk, must be
     *        non-negative and smaller than max_chunk_bytes
     * @throws std::invalid_argument on an invalid combination
     */
    ParagraphChunker(int max_chunk_bytes, int overlap_bytes);

    /**
     * @brief Chunks the given text
     *
     * @param text Sanitized input text
     * @return Chunks in input order; empty input yields no chunks
     */
    std::vector<std::string> chunk(const std::string& text) const;

    int maxChunkBytes() const { return max_chunk_bytes_; }
    int overlapBytes() const { return overlap_bytes_; }

    /**
     * @brief Splits on runs of newlines, trims each piece, and drops empty ones
     */
    static std::vector<std::string> splitParagraphs(const std::string& text);

    /**
     * @brief Splits after `.`, `!` or `?` when followed by whitespace
     *
     * The whitespace between sentences is dropped; a paragraph without such a
     * boundary comes back as a single sentence.
     */
    static std::vector<std::string> splitSentences(const std::string& paragraph);

    /**
     * @brief Returns the trailing whole words of `text` that fit in `max_bytes`
     *
     * Each word is charged its length plus one separating space. The last
     * word is always kept, even when it alone exceeds the budget.
     */
    static std::string trailingWords(const std::string& text, size_t max_bytes);

private:
    struct Unit
    {
        std::string text;
        char separator; // joins this unit to the previous one inside a chunk
    };

    std::vector<Unit> toUnits(const std::vector<std::string>& paragraphs) const;

    int max_chunk_bytes_;
    int overlap_bytes_;
};

/**
 * @brief Convenience wrapper around ParagraphChunker
 */
DOCCHUNK_API std::vector<std::string> chunkByParagraph(const std::string& text,
                                                       int max_chunk_bytes,
                                                       int overlap_bytes);

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_PARAGRAPH_CHUNKER_HPP
