#ifndef DOCCHUNK_SLIDE_MODEL_HPP
#define DOCCHUNK_SLIDE_MODEL_HPP

#include "../export.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <pugixml.hpp>

namespace docchunk
{
namespace retrieval
{
namespace ooxml
{

// Typed view of the PresentationML/DrawingML subset the pipeline consumes.
// Built once per part by mapShapeTree(); everything downstream pattern
// matches on these types instead of searching the raw XML.

struct TextRun
{
    std::string text;
};

struct LineBreak
{
};

using ParagraphElement = std::variant<TextRun, LineBreak>;

struct Paragraph
{
    std::vector<ParagraphElement> elements;
    bool hasEndMarker = false; // a:endParaRPr present
};

struct TextBody
{
    std::vector<Paragraph> paragraphs;
};

struct Blip
{
    std::string relId; // r:embed
};

struct TableCell
{
    TextBody body;
};

struct TableRow
{
    std::vector<TableCell> cells;
};

struct Table
{
    std::vector<TableRow> rows;
};

struct Placeholder
{
    std::string type; // empty when the ph element has no type attribute
};

// p:sp
struct Shape
{
    std::optional<Placeholder> placeholder;
    std::optional<TextBody> text;
    std::vector<Blip> blips;
    std::vector<std::string> chartLabels;
};

// p:pic
struct Picture
{
    std::optional<Placeholder> placeholder;
    std::vector<Blip> blips;
};

// p:graphicFrame, the usual home of tables and charts
struct GraphicFrame
{
    std::optional<Table> table;
    std::vector<std::string> chartLabels;
    std::vector<Blip> blips;
};

// p:grpSp; only direct members are kept
struct Group
{
    std::vector<Shape> shapes;
    std::vector<Picture> pictures;
};

struct ShapeTree
{
    std::vector<Shape> shapes;
    std::vector<Picture> pictures;
    std::vector<Group> groups;
    std::vector<GraphicFrame> frames;
};

using SlideShape = std::variant<Shape, Picture, GraphicFrame>;

enum class ShapeKind
{
    Title,
    Table,
    Chart,
    Picture,
    PlainText,
    Unknown
};

/**
 * @brief Maps the p:cSld/p:spTree of a slide or notes part to a ShapeTree
 *
 * @param doc Parsed part (root element p:sld or p:notes)
 * @return The shape tree, or std::nullopt when the part has no shape tree
 */
DOCCHUNK_API std::optional<ShapeTree> mapShapeTree(const pugi::xml_document& doc);

/**
 * @brief Flattens a shape tree into reading order
 *
 * Ungrouped shapes, then pictures, then the members of each group (shapes
 * before pictures, group by group), then graphic frames.
 */
DOCCHUNK_API std::vector<SlideShape> readingOrder(const ShapeTree& tree);

/**
 * @brief Classifies a shape once, for a single dispatch in the extractor
 */
DOCCHUNK_API ShapeKind classifyShape(const SlideShape& shape);

bool isTitlePlaceholder(const std::optional<Placeholder>& placeholder);

/**
 * @brief Text of a body with its line structure
 *
 * Runs of a paragraph are concatenated, a:br becomes a newline, and
 * paragraphs are joined with newlines. An empty paragraph closed by
 * a:endParaRPr shows up as an empty line; a bare <a:p/> is skipped.
 */
DOCCHUNK_API std::string bodyText(const TextBody& body);

/**
 * @brief Text of a body on a single line, runs and paragraphs joined by spaces
 */
DOCCHUNK_API std::string flatText(const TextBody& body);

// Markdown-style rendering: "**Table:**" followed by "| a | b |" rows; empty rows are dropped
DOCCHUNK_API std::string renderTable(const Table& table);

} // namespace ooxml
} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_SLIDE_MODEL_HPP
