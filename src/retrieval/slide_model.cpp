#include "docchunk/retrieval/slide_model.hpp"
#include "docchunk/utils.hpp"
#include <cstring>

namespace docchunk
{
namespace retrieval
{
namespace ooxml
{

namespace
{
    const char* localName(const char* qname)
    {
        const char* colon = std::strchr(qname, ':');
        return colon ? colon + 1 : qname;
    }

    bool isElement(const pugi::xml_node& node, const char* name)
    {
        return node.type() == pugi::node_element && std::strcmp(localName(node.name()), name) == 0;
    }

    // Chart markup keeps the c: prefix so DrawingML's a:tx-like names never match
    bool isChartTextNode(const pugi::xml_node& node)
    {
        if (node.type() != pugi::node_element)
            return false;
        const char* name = node.name();
        return std::strcmp(name, "c:tx") == 0 || std::strcmp(name, "c:rich") == 0 ||
               std::strcmp(name, "c:strRef") == 0;
    }

    pugi::xml_node childByLocalName(const pugi::xml_node& parent, const char* name)
    {
        for (auto child : parent.children())
        {
            if (isElement(child, name))
                return child;
        }
        return {};
    }

    pugi::xml_attribute attributeByLocalName(const pugi::xml_node& node, const char* name)
    {
        for (auto attr : node.attributes())
        {
            if (std::strcmp(localName(attr.name()), name) == 0)
                return attr;
        }
        return {};
    }

    // Concatenated text of every a:t below the node
    std::string runText(const pugi::xml_node& node)
    {
        std::string text;
        for (auto child : node.children())
        {
            if (isElement(child, "t"))
                text += child.text().get();
            else if (child.type() == pugi::node_element)
                text += runText(child);
        }
        return text;
    }

    Paragraph mapParagraph(const pugi::xml_node& p)
    {
        Paragraph paragraph;
        for (auto child : p.children())
        {
            if (isElement(child, "r") || isElement(child, "fld"))
                paragraph.elements.emplace_back(TextRun{runText(child)});
            else if (isElement(child, "br"))
                paragraph.elements.emplace_back(LineBreak{});
            else if (isElement(child, "endParaRPr"))
                paragraph.hasEndMarker = true;
        }
        return paragraph;
    }

    std::optional<TextBody> mapTextBody(const pugi::xml_node& txBody)
    {
        if (!txBody)
            return std::nullopt;

        TextBody body;
        for (auto child : txBody.children())
        {
            if (isElement(child, "p"))
                body.paragraphs.push_back(mapParagraph(child));
        }
        return body;
    }

    std::optional<Placeholder> mapPlaceholder(const pugi::xml_node& nonVisualProps)
    {
        pugi::xml_node nvPr = childByLocalName(nonVisualProps, "nvPr");
        pugi::xml_node ph = childByLocalName(nvPr, "ph");
        if (!ph)
            return std::nullopt;
        return Placeholder{ph.attribute("type").as_string()};
    }

    void collectBlips(const pugi::xml_node& node, std::vector<Blip>& blips)
    {
        for (auto child : node.children())
        {
            if (child.type() != pugi::node_element)
                continue;
            if (isElement(child, "blip"))
            {
                auto embed = attributeByLocalName(child, "embed");
                if (embed && *embed.value())
                    blips.push_back(Blip{embed.value()});
            }
            collectBlips(child, blips);
        }
    }

    void collectChartLabels(const pugi::xml_node& node, std::vector<std::string>& labels)
    {
        for (auto child : node.children())
        {
            if (child.type() != pugi::node_element)
                continue;
            if (isChartTextNode(child))
            {
                std::string text;
                for (auto descendant : child.select_nodes(".//*"))
                {
                    const auto element = descendant.node();
                    if (isElement(element, "t") || isElement(element, "v"))
                    {
                        if (!text.empty())
                            text += " ";
                        text += element.text().get();
                    }
                }
                text = collapse_whitespace(text);
                if (!text.empty())
                    labels.push_back(text);
                continue;
            }
            collectChartLabels(child, labels);
        }
    }

    Shape mapShape(const pugi::xml_node& sp)
    {
        Shape shape;
        shape.placeholder = mapPlaceholder(childByLocalName(sp, "nvSpPr"));
        shape.text = mapTextBody(childByLocalName(sp, "txBody"));
        collectBlips(childByLocalName(sp, "spPr"), shape.blips);
        collectChartLabels(sp, shape.chartLabels);
        return shape;
    }

    Picture mapPicture(const pugi::xml_node& pic)
    {
        Picture picture;
        picture.placeholder = mapPlaceholder(childByLocalName(pic, "nvPicPr"));
        collectBlips(childByLocalName(pic, "blipFill"), picture.blips);
        return picture;
    }

    std::optional<Table> mapTable(const pugi::xml_node& frame)
    {
        pugi::xml_node graphicData = childByLocalName(childByLocalName(frame, "graphic"), "graphicData");
        pugi::xml_node tbl = childByLocalName(graphicData, "tbl");
        if (!tbl)
            return std::nullopt;

        Table table;
        for (auto tr : tbl.children())
        {
            if (!isElement(tr, "tr"))
                continue;
            TableRow row;
            for (auto tc : tr.children())
            {
                if (!isElement(tc, "tc"))
                    continue;
                TableCell cell;
                if (auto body = mapTextBody(childByLocalName(tc, "txBody")))
                    cell.body = std::move(*body);
                row.cells.push_back(std::move(cell));
            }
            table.rows.push_back(std::move(row));
        }
        return table;
    }

    GraphicFrame mapGraphicFrame(const pugi::xml_node& node)
    {
        GraphicFrame frame;
        frame.table = mapTable(node);
        if (!frame.table)
        {
            collectChartLabels(node, frame.chartLabels);
        }
        collectBlips(node, frame.blips);
        return frame;
    }

    bool hasText(const std::optional<TextBody>& body)
    {
        return body && !trim_copy(bodyText(*body)).empty();
    }
}

bool isTitlePlaceholder(const std::optional<Placeholder>& placeholder)
{
    return placeholder && (placeholder->type == "title" || placeholder->type == "ctrTitle");
}

std::optional<ShapeTree> mapShapeTree(const pugi::xml_document& doc)
{
    pugi::xml_node root = doc.document_element();
    pugi::xml_node spTree = childByLocalName(childByLocalName(root, "cSld"), "spTree");
    if (!spTree)
        return std::nullopt;

    ShapeTree tree;
    for (auto child : spTree.children())
    {
        if (isElement(child, "sp"))
        {
            tree.shapes.push_back(mapShape(child));
        }
        else if (isElement(child, "pic"))
        {
            tree.pictures.push_back(mapPicture(child));
        }
        else if (isElement(child, "grpSp"))
        {
            Group group;
            for (auto member : child.children())
            {
                if (isElement(member, "sp"))
                    group.shapes.push_back(mapShape(member));
                else if (isElement(member, "pic"))
                    group.pictures.push_back(mapPicture(member));
            }
            tree.groups.push_back(std::move(group));
        }
        else if (isElement(child, "graphicFrame"))
        {
            tree.frames.push_back(mapGraphicFrame(child));
        }
    }
    return tree;
}

std::vector<SlideShape> readingOrder(const ShapeTree& tree)
{
    std::vector<SlideShape> ordered;
    for (const auto& shape : tree.shapes)
        ordered.emplace_back(shape);
    for (const auto& picture : tree.pictures)
        ordered.emplace_back(picture);
    for (const auto& group : tree.groups)
    {
        for (const auto& shape : group.shapes)
            ordered.emplace_back(shape);
        for (const auto& picture : group.pictures)
            ordered.emplace_back(picture);
    }
    for (const auto& frame : tree.frames)
        ordered.emplace_back(frame);
    return ordered;
}

ShapeKind classifyShape(const SlideShape& shape)
{
    if (const auto* sp = std::get_if<Shape>(&shape))
    {
        if (isTitlePlaceholder(sp->placeholder))
            return ShapeKind::Title;
        if (!sp->chartLabels.empty())
            return ShapeKind::Chart;
        if (hasText(sp->text))
            return ShapeKind::PlainText;
        if (!sp->blips.empty())
            return ShapeKind::Picture;
        return ShapeKind::Unknown;
    }

    if (const auto* pic = std::get_if<Picture>(&shape))
    {
        return pic->blips.empty() ? ShapeKind::Unknown : ShapeKind::Picture;
    }

    const auto& frame = std::get<GraphicFrame>(shape);
    if (frame.table)
        return ShapeKind::Table;
    if (!frame.chartLabels.empty())
        return ShapeKind::Chart;
    if (!frame.blips.empty())
        return ShapeKind::Picture;
    return ShapeKind::Unknown;
}

std::string bodyText(const TextBody& body)
{
    std::string text;
    bool first = true;
    for (const auto& paragraph : body.paragraphs)
    {
        // A bare <a:p/> carries nothing; an empty paragraph closed by an end marker is a blank line
        if (paragraph.elements.empty() && !paragraph.hasEndMarker)
            continue;

        if (!first)
            text += "\n";
        first = false;

        for (const auto& element : paragraph.elements)
        {
            if (const auto* run = std::get_if<TextRun>(&element))
                text += run->text;
            else
                text += "\n";
        }
    }
    return text;
}

std::string flatText(const TextBody& body)
{
    return collapse_whitespace(bodyText(body));
}

std::string renderTable(const Table& table)
{
    std::string rendered;
    for (const auto& row : table.rows)
    {
        std::string line = "|";
        bool anyText = false;
        for (const auto& cell : row.cells)
        {
            const std::string text = flatText(cell.body);
            anyText = anyText || !text.empty();
            line += " " + text + " |";
        }
        if (anyText)
        {
            rendered += "\n" + line;
        }
    }
    return rendered.empty() ? rendered : "**Table:**" + rendered;
}

} // namespace ooxml
} // namespace retrieval
} // namespace docchunk
