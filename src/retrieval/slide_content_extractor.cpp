#include "docchunk/retrieval/slide_content_extractor.hpp"
#include "docchunk/retrieval/slide_model.hpp"
#include "docchunk/retrieval/text_sanitizer.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <exception>

namespace docchunk
{
namespace retrieval
{

namespace
{
    class ItemCollector
    {
    public:
        explicit ItemCollector(int slideNumber) : slideNumber_(slideNumber) {}

        void addText(ContentKind kind, const std::string& raw)
        {
            std::string content = trim_copy(cleanText(raw));
            if (content.empty())
                return;

            ContentItem item;
            item.kind = kind;
            item.content = std::move(content);
            item.sequencePosition = nextPosition_++;
            item.slideNumber = slideNumber_;
            items_.push_back(std::move(item));
        }

        void addImages(const std::vector<ooxml::Blip>& blips)
        {
            for (const auto& blip : blips)
            {
                PipelineLogger::logDebug("Found image with relationship ID: %s in slide %d",
                                         blip.relId.c_str(), slideNumber_);
                ContentItem item;
                item.kind = ContentKind::Image;
                item.imageRelId = blip.relId;
                item.sequencePosition = nextPosition_++;
                item.slideNumber = slideNumber_;
                items_.push_back(std::move(item));
            }
        }

        std::vector<ContentItem> take() { return std::move(items_); }

    private:
        int slideNumber_;
        int nextPosition_ = 0;
        std::vector<ContentItem> items_;
    };

    const std::vector<ooxml::Blip>& blipsOf(const ooxml::SlideShape& shape)
    {
        if (const auto* sp = std::get_if<ooxml::Shape>(&shape))
            return sp->blips;
        if (const auto* pic = std::get_if<ooxml::Picture>(&shape))
            return pic->blips;
        return std::get<ooxml::GraphicFrame>(shape).blips;
    }

    const std::vector<std::string>* chartLabelsOf(const ooxml::SlideShape& shape)
    {
        if (const auto* sp = std::get_if<ooxml::Shape>(&shape))
            return &sp->chartLabels;
        if (const auto* frame = std::get_if<ooxml::GraphicFrame>(&shape))
            return &frame->chartLabels;
        return nullptr;
    }

    std::string joinLabels(const std::vector<std::string>& labels)
    {
        std::string joined;
        for (const auto& label : labels)
        {
            if (!joined.empty())
                joined += ", ";
            joined += label;
        }
        return joined;
    }

    std::string slideTitle(const std::vector<ooxml::SlideShape>& shapes)
    {
        for (const auto& shape : shapes)
        {
            const auto* sp = std::get_if<ooxml::Shape>(&shape);
            if (!sp || !ooxml::isTitlePlaceholder(sp->placeholder) || !sp->text)
                continue;
            std::string title = ooxml::flatText(*sp->text);
            if (!title.empty())
                return title;
        }
        return "";
    }

    std::vector<ContentItem> extractItems(const pugi::xml_document& slide, int slideNumber)
    {
        auto tree = ooxml::mapShapeTree(slide);
        if (!tree)
        {
            PipelineLogger::logWarning("No slide content found in slide %d", slideNumber);
            return {};
        }

        const auto shapes = ooxml::readingOrder(*tree);
        PipelineLogger::logDebug("Found %zu shapes in slide %d", shapes.size(), slideNumber);

        ItemCollector collector(slideNumber);

        const std::string title = slideTitle(shapes);
        if (!title.empty())
        {
            collector.addText(ContentKind::Title, "## " + title);
        }

        for (const auto& shape : shapes)
        {
            switch (ooxml::classifyShape(shape))
            {
            case ooxml::ShapeKind::Title:
                // Heading already emitted; a picture fill on the title shape still counts
                collector.addImages(blipsOf(shape));
                break;
            case ooxml::ShapeKind::Table:
                collector.addText(ContentKind::Table,
                                  ooxml::renderTable(*std::get<ooxml::GraphicFrame>(shape).table));
                break;
            case ooxml::ShapeKind::Chart:
                collector.addText(ContentKind::Text, "**Chart:** " + joinLabels(*chartLabelsOf(shape)));
                break;
            case ooxml::ShapeKind::Picture:
                collector.addImages(blipsOf(shape));
                break;
            case ooxml::ShapeKind::PlainText:
            {
                const auto& sp = std::get<ooxml::Shape>(shape);
                collector.addImages(sp.blips);
                collector.addText(ContentKind::Text, ooxml::bodyText(*sp.text));
                break;
            }
            case ooxml::ShapeKind::Unknown:
                break;
            }
        }

        auto items = collector.take();
        PipelineLogger::logDebug("Processed %zu content items from slide %d", items.size(), slideNumber);
        return items;
    }
}

std::vector<ContentItem> extractSlideContent(const pugi::xml_document& slide, int slide_number)
{
    try
    {
        return extractItems(slide, slide_number);
    }
    catch (const std::exception& ex)
    {
        PipelineLogger::logWarning("Failed to extract content from slide %d: %s", slide_number, ex.what());
        return {};
    }
}

} // namespace retrieval
} // namespace docchunk
