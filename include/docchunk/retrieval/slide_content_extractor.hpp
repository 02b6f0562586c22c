#ifndef DOCCHUNK_SLIDE_CONTENT_EXTRACTOR_HPP
#define DOCCHUNK_SLIDE_CONTENT_EXTRACTOR_HPP

#include "../export.hpp"
#include "content_types.hpp"
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Produces the ordered content items of one slide
 *
 * The slide title comes first as a "## " heading, followed by the items of
 * every shape in reading order (see ooxml::readingOrder). Tables, chart
 * labels, images and plain text are emitted according to the shape's
 * classification. A slide without a shape tree, or one that fails to map,
 * yields no items and a warning; this function never throws.
 *
 * @param slide Parsed ppt/slides/slideN.xml
 * @param slide_number 1-based slide index, copied into every item
 */
DOCCHUNK_API std::vector<ContentItem> extractSlideContent(const pugi::xml_document& slide, int slide_number);

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_SLIDE_CONTENT_EXTRACTOR_HPP
