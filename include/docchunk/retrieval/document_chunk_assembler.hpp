#ifndef DOCCHUNK_DOCUMENT_CHUNK_ASSEMBLER_HPP
#define DOCCHUNK_DOCUMENT_CHUNK_ASSEMBLER_HPP

#include "../export.hpp"
#include "content_types.hpp"
#include "image_asset_pipeline.hpp"
#include "paragraph_chunker.hpp"
#include "relationship_resolver.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace docchunk
{
namespace retrieval
{

class OOXMLContainer;

/**
 * @brief Mutable bookkeeping of one document pass
 *
 * Every step function of the assembler takes this by reference; nothing about
 * a run lives in the assembler itself, so one assembler can serve several
 * documents concurrently as long as each pass owns its own state.
 */
struct AssemblerState
{
    int globalSeq = 0;                 // next position in the shared text/image ordering
    size_t totalTextLength = 0;        // bytes buffered so far, checked against the document budget
    std::string crossImageOverlap;     // seeds the next text flush
    std::vector<std::string> textBuffer;
    DescriptionCache descriptionCache;
    ProcessingResult result;
    bool budgetExhausted = false;
};

struct ProcessingOptions
{
    bool extractImages = true;
    bool describeImages = true;
    // Checked between slides; when set, iteration stops and the chunks emitted so far are returned
    const std::atomic<bool>* cancelFlag = nullptr;
};

/**
 * @brief Turns a presentation (or plain text) into positioned text and image chunks
 *
 * Slides are visited in ascending slide number. Text-bearing items are
 * buffered and chunked per slide; an image flushes the buffer first, so the
 * positions of text and image chunks follow the reading order of the deck.
 * Container failures yield an empty result, every other failure is recovered
 * at the slide or image that caused it.
 */
class DOCCHUNK_API DocumentChunkAssembler
{
public:
    struct Config
    {
        int maxChunkBytes = 512;
        int overlapBytes = 128;
        size_t crossImageOverlapBytes = 32;
        size_t maxTextLength = 2000000; // bytes per document
    };

    /**
     * @param config Chunking and budget settings
     * @param images Image pipeline; when null, images are never extracted
     * @throws std::invalid_argument when the chunk sizes are inconsistent
     */
    DocumentChunkAssembler(Config config, std::shared_ptr<ImageAssetPipeline> images);

    /**
     * @brief Processes a .pptx package
     *
     * @param bytes Raw package bytes
     * @param document_id Identifier used for log lines and image storage
     * @param options Extraction switches and the optional cancel flag
     * @return The chunks; empty when the package cannot be opened. Never throws.
     */
    ProcessingResult processPresentation(std::string bytes, const std::string& document_id,
                                         const ProcessingOptions& options) const;

    /**
     * @brief Processes long-form plain text with the same numbering rules
     *
     * The text is sanitized and truncated at the last whole paragraph that
     * fits the document budget. No image chunks are produced.
     */
    ProcessingResult processText(const std::string& text, const std::string& document_id) const;

    /**
     * @brief Adds one text-bearing item to the buffer
     *
     * @return false when the item would exceed the document budget; the
     *         state is then marked exhausted and the item is not buffered
     */
    bool bufferText(AssemblerState& state, const std::string& content) const;

    // Chunks the buffered text, prefixed by any pending cross-image overlap
    void flushText(AssemblerState& state, bool extract_images) const;

    /**
     * @brief Runs one image item through the pipeline and records its chunk
     *
     * @return true when an image chunk was emitted
     */
    bool processImage(AssemblerState& state, const OOXMLContainer& container, const RelationshipMap& relationships,
                      const ContentItem& item, const std::string& document_id, bool describe_images) const;

    // Final flush at end of document
    void finalize(AssemblerState& state, bool extract_images) const;

    const Config& config() const { return config_; }

private:
    void processSlide(AssemblerState& state, const OOXMLContainer& container, const std::string& slide_path,
                      int slide_number, const std::string& document_id, const ProcessingOptions& options) const;

    void emitTextChunks(AssemblerState& state, const std::vector<std::string>& chunks) const;

    Config config_;
    ParagraphChunker chunker_;
    std::shared_ptr<ImageAssetPipeline> images_;
};

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_DOCUMENT_CHUNK_ASSEMBLER_HPP
