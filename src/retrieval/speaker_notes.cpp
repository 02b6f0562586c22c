#include "docchunk/retrieval/speaker_notes.hpp"
#include "docchunk/retrieval/slide_model.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <exception>

namespace docchunk
{
namespace retrieval
{

namespace
{
    bool isNotesPlaceholder(const std::optional<ooxml::Placeholder>& placeholder)
    {
        if (!placeholder)
            return false;
        const std::string& type = placeholder->type;
        return type.empty() || type == "body" || type == "obj";
    }
}

std::string extractSpeakerNotes(const OOXMLContainer& container, int slide_number)
{
    const std::string notesPath = "ppt/notesSlides/notesSlide" + std::to_string(slide_number) + ".xml";

    try
    {
        auto notes = container.readXml(notesPath);
        if (!notes)
        {
            return "";
        }

        auto tree = ooxml::mapShapeTree(*notes);
        if (!tree)
        {
            return "";
        }

        std::string collected;
        for (const auto& shape : tree->shapes)
        {
            if (!isNotesPlaceholder(shape.placeholder) || !shape.text)
            {
                continue;
            }
            const std::string text = trim_copy(ooxml::bodyText(*shape.text));
            if (text.empty())
            {
                continue;
            }
            if (!collected.empty())
            {
                collected += "\n";
            }
            collected += text;
        }
        return collected;
    }
    catch (const std::exception& ex)
    {
        PipelineLogger::logDebug("Could not extract speaker notes for slide %d: %s", slide_number, ex.what());
        return "";
    }
}

} // namespace retrieval
} // namespace docchunk
