#ifndef DOCCHUNK_SPEAKER_NOTES_HPP
#define DOCCHUNK_SPEAKER_NOTES_HPP

#include "../export.hpp"
#include "ooxml_container.hpp"
#include <string>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Extracts the speaker notes of a slide
 *
 * Reads ppt/notesSlides/notesSlideN.xml and collects the text of placeholder
 * shapes typed body, obj or untyped; the slide thumbnail placeholder is
 * skipped. Notes are supplementary, so any failure yields an empty string.
 */
DOCCHUNK_API std::string extractSpeakerNotes(const OOXMLContainer& container, int slide_number);

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_SPEAKER_NOTES_HPP
