#ifndef DOCCHUNK_RELATIONSHIP_RESOLVER_HPP
#define DOCCHUNK_RELATIONSHIP_RESOLVER_HPP

#include "../export.hpp"
#include <string>
#include <unordered_map>
#include <pugixml.hpp>

namespace docchunk
{
namespace retrieval
{

// relationship id -> zip-internal asset path, scoped to one slide
using RelationshipMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Builds the relationship map of one slide
 *
 * Targets are resolved to package paths: a leading "../" is stripped and the
 * result placed under "ppt/" ("../media/image1.png" -> "ppt/media/image1.png"),
 * and a package-absolute "/ppt/media/x.png" just loses its leading slash.
 * External relationships (hyperlinks and the like) are skipped.
 *
 * @param rels Parsed ppt/slides/_rels/slideN.xml.rels, or nullptr when absent
 * @return The map; empty for an absent or malformed part
 */
DOCCHUNK_API RelationshipMap resolveRelationships(const pugi::xml_document* rels);

// "ppt/slides/slide3.xml" -> "ppt/slides/_rels/slide3.xml.rels"
DOCCHUNK_API std::string relationshipPartFor(const std::string& part_path);

DOCCHUNK_API std::string resolveTargetPath(const std::string& target);

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_RELATIONSHIP_RESOLVER_HPP
