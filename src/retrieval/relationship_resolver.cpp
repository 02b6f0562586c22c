#include "docchunk/retrieval/relationship_resolver.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"

namespace docchunk
{
namespace retrieval
{

std::string relationshipPartFor(const std::string& part_path)
{
    const size_t slash = part_path.find_last_of('/');
    if (slash == std::string::npos)
    {
        return "_rels/" + part_path + ".rels";
    }
    return part_path.substr(0, slash + 1) + "_rels/" + part_path.substr(slash + 1) + ".rels";
}

std::string resolveTargetPath(const std::string& target)
{
    if (starts_with(target, "/"))
    {
        return target.substr(1);
    }

    std::string relative = target;
    if (starts_with(relative, "../"))
    {
        relative = relative.substr(3);
    }
    return "ppt/" + relative;
}

RelationshipMap resolveRelationships(const pugi::xml_document* rels)
{
    RelationshipMap relationships;
    if (!rels)
    {
        return relationships;
    }

    pugi::xml_node root = rels->child("Relationships");
    if (!root)
    {
        PipelineLogger::logWarning("Relationship part has no Relationships element");
        return relationships;
    }

    for (auto rel : root.children("Relationship"))
    {
        const std::string id = rel.attribute("Id").as_string();
        const std::string target = rel.attribute("Target").as_string();
        if (id.empty() || target.empty())
        {
            continue;
        }
        if (std::string(rel.attribute("TargetMode").as_string()) == "External")
        {
            continue;
        }
        relationships.emplace(id, resolveTargetPath(target));
    }

    return relationships;
}

} // namespace retrieval
} // namespace docchunk
