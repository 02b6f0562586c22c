#include "docchunk/retrieval/document_chunk_assembler.hpp"
#include "docchunk/retrieval/ooxml_container.hpp"
#include "docchunk/retrieval/slide_content_extractor.hpp"
#include "docchunk/retrieval/speaker_notes.hpp"
#include "docchunk/retrieval/text_sanitizer.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <stdexcept>
#include <utility>

namespace docchunk
{
namespace retrieval
{

DocumentChunkAssembler::DocumentChunkAssembler(Config config, std::shared_ptr<ImageAssetPipeline> images)
    : config_(config), chunker_(config.maxChunkBytes, config.overlapBytes), images_(std::move(images))
{
}

ProcessingResult DocumentChunkAssembler::processPresentation(std::string bytes, const std::string& document_id,
                                                             const ProcessingOptions& options) const
{
    AssemblerState state;

    const bool extractImages = options.extractImages && images_ != nullptr;
    if (options.extractImages && !images_)
    {
        PipelineLogger::logWarning("Image extraction requested for %s but no image pipeline is configured",
                                   document_id.c_str());
    }

    std::unique_ptr<OOXMLContainer> container;
    try
    {
        container = OOXMLContainer::open(std::move(bytes));
    }
    catch (const ContainerError& ex)
    {
        if (ex.failure() == ContainerFailure::PasswordProtected)
        {
            PipelineLogger::logWarning("Document %s is password protected, skipping: %s", document_id.c_str(), ex.what());
        }
        else
        {
            PipelineLogger::logError("Document %s is not a readable presentation: %s", document_id.c_str(), ex.what());
        }
        return ProcessingResult();
    }

    const std::vector<std::string> slides = container->listParts("ppt/slides/slide*.xml");
    if (slides.empty())
    {
        PipelineLogger::logWarning("No slides found in %s", document_id.c_str());
        return ProcessingResult();
    }

    PipelineLogger::logInfo("Processing %zu slides from %s", slides.size(), document_id.c_str());

    for (const auto& slidePath : slides)
    {
        if (options.cancelFlag && options.cancelFlag->load())
        {
            PipelineLogger::logInfo("Processing of %s cancelled before %s", document_id.c_str(), slidePath.c_str());
            state.textBuffer.clear();
            state.crossImageOverlap.clear();
            return std::move(state.result);
        }

        const int slideNumber = OOXMLContainer::partIndex(slidePath);
        try
        {
            processSlide(state, *container, slidePath, slideNumber, document_id, options);
        }
        catch (const std::exception& ex)
        {
            PipelineLogger::logWarning("Failed to process slide %d of %s: %s", slideNumber, document_id.c_str(), ex.what());
            state.textBuffer.clear();
        }

        if (state.budgetExhausted)
        {
            break;
        }
    }

    finalize(state, extractImages);

    PipelineLogger::logInfo("Presentation %s processed. Total text chunks: %zu, Total image chunks: %zu",
                            document_id.c_str(), state.result.text_chunks.size(), state.result.image_chunks.size());
    return std::move(state.result);
}

void DocumentChunkAssembler::processSlide(AssemblerState& state, const OOXMLContainer& container,
                                          const std::string& slide_path, int slide_number,
                                          const std::string& document_id, const ProcessingOptions& options) const
{
    const bool extractImages = options.extractImages && images_ != nullptr;

    auto slide = container.readXml(slide_path);
    if (!slide)
    {
        PipelineLogger::logWarning("Slide part %s disappeared from %s", slide_path.c_str(), document_id.c_str());
        return;
    }

    RelationshipMap relationships;
    const std::string relsPath = relationshipPartFor(slide_path);
    try
    {
        auto rels = container.readXml(relsPath);
        if (!rels)
        {
            PipelineLogger::logDebug("No relationships part for slide %d", slide_number);
        }
        relationships = resolveRelationships(rels.get());
    }
    catch (const std::exception& ex)
    {
        PipelineLogger::logDebug("Ignoring unreadable relationships part %s: %s", relsPath.c_str(), ex.what());
    }

    std::vector<ContentItem> items = extractSlideContent(*slide, slide_number);

    const std::string notes = trim_copy(cleanText(extractSpeakerNotes(container, slide_number)));
    if (!notes.empty())
    {
        ContentItem item;
        item.kind = ContentKind::Notes;
        item.content = "**Speaker Notes:**\n" + notes;
        item.sequencePosition = static_cast<int>(items.size());
        item.slideNumber = slide_number;
        items.push_back(std::move(item));
    }

    for (const auto& item : items)
    {
        if (item.isTextBearing())
        {
            if (item.content.empty())
            {
                continue;
            }
            if (!bufferText(state, item.content))
            {
                PipelineLogger::logInfo("Text length exceeded for %s at %s item of slide %d, indexing with incomplete content",
                                        document_id.c_str(), contentKindName(item.kind), slide_number);
                break;
            }
        }
        else if (extractImages && !item.imageRelId.empty())
        {
            flushText(state, true);
            processImage(state, container, relationships, item, document_id, options.describeImages);
        }
    }

    flushText(state, extractImages);
}

bool DocumentChunkAssembler::bufferText(AssemblerState& state, const std::string& content) const
{
    if (state.budgetExhausted)
    {
        return false;
    }
    if (state.totalTextLength + content.size() > config_.maxTextLength)
    {
        state.budgetExhausted = true;
        return false;
    }

    state.textBuffer.push_back(content);
    state.totalTextLength += content.size();
    return true;
}

void DocumentChunkAssembler::flushText(AssemblerState& state, bool extract_images) const
{
    if (state.textBuffer.empty())
    {
        return;
    }

    std::string text;
    for (size_t i = 0; i < state.textBuffer.size(); ++i)
    {
        if (i > 0)
        {
            text += '\n';
        }
        text += state.textBuffer[i];
    }
    state.textBuffer.clear();

    if (extract_images && !state.crossImageOverlap.empty())
    {
        text = state.crossImageOverlap + " " + text;
    }
    state.crossImageOverlap.clear();

    const std::vector<std::string> chunks = chunker_.chunk(text);
    emitTextChunks(state, chunks);

    if (extract_images && !chunks.empty())
    {
        state.crossImageOverlap = ParagraphChunker::trailingWords(text, config_.crossImageOverlapBytes);
    }
}

bool DocumentChunkAssembler::processImage(AssemblerState& state, const OOXMLContainer& container,
                                          const RelationshipMap& relationships, const ContentItem& item,
                                          const std::string& document_id, bool describe_images) const
{
    if (!images_)
    {
        return false;
    }

    auto rel = relationships.find(item.imageRelId);
    if (rel == relationships.end())
    {
        PipelineLogger::logWarning("Could not resolve relationship ID: %s in slide %d",
                                   item.imageRelId.c_str(), item.slideNumber);
        return false;
    }

    const std::string& assetPath = rel->second;
    std::optional<std::string> bytes;
    try
    {
        // One byte past the limit is enough for the size gate to reject it
        bytes = container.readPart(assetPath, images_->config().maxFileSize + 1);
    }
    catch (const std::exception& ex)
    {
        PipelineLogger::logWarning("Failed to read image %s from slide %d: %s",
                                   assetPath.c_str(), item.slideNumber, ex.what());
        return false;
    }

    if (!bytes)
    {
        PipelineLogger::logWarning("Could not find image file: %s", assetPath.c_str());
        return false;
    }

    ImageProcessResult processed = images_->process(*bytes, assetPath, state.descriptionCache, document_id,
                                                    state.globalSeq, describe_images);
    if (!processed.success)
    {
        PipelineLogger::logDebug("Image %s from slide %d not indexed: %s", assetPath.c_str(), item.slideNumber,
                                 imageSkipReasonName(processed.skipReason));
        return false;
    }

    state.result.image_chunks.push_back(processed.description);
    state.result.image_chunk_pos.push_back(state.globalSeq);
    state.crossImageOverlap += " [[IMG#" + std::to_string(state.globalSeq) + "]] ";
    ++state.globalSeq;

    PipelineLogger::logDebug("Processed image %s from slide %d", assetPath.c_str(), item.slideNumber);
    return true;
}

void DocumentChunkAssembler::finalize(AssemblerState& state, bool extract_images) const
{
    flushText(state, extract_images);

    // Only already-indexed words and placeholders remain; nothing new to chunk
    if (!state.crossImageOverlap.empty())
    {
        PipelineLogger::logDebug("Dropping trailing cross-image overlap (%zu bytes)", state.crossImageOverlap.size());
        state.crossImageOverlap.clear();
    }
}

ProcessingResult DocumentChunkAssembler::processText(const std::string& text, const std::string& document_id) const
{
    AssemblerState state;

    for (const auto& paragraph : ParagraphChunker::splitParagraphs(cleanText(text)))
    {
        if (!bufferText(state, paragraph))
        {
            PipelineLogger::logInfo("Text length exceeded for %s, indexing with incomplete content", document_id.c_str());
            break;
        }
    }

    flushText(state, false);

    PipelineLogger::logInfo("Text document %s processed. Total text chunks: %zu",
                            document_id.c_str(), state.result.text_chunks.size());
    return std::move(state.result);
}

void DocumentChunkAssembler::emitTextChunks(AssemblerState& state, const std::vector<std::string>& chunks) const
{
    for (const auto& chunk : chunks)
    {
        state.result.text_chunks.push_back(chunk);
        state.result.text_chunk_pos.push_back(state.globalSeq++);
    }
}

} // namespace retrieval
} // namespace docchunk
