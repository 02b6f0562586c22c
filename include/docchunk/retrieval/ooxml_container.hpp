#ifndef DOCCHUNK_OOXML_CONTAINER_HPP
#define DOCCHUNK_OOXML_CONTAINER_HPP

#include "../export.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace docchunk
{
namespace retrieval
{

enum class ContainerFailure
{
    PasswordProtected,
    CorruptArchive
};

/**
 * @brief Thrown when the package as a whole cannot be opened
 *
 * Callers treat PasswordProtected as an expected input class and
 * CorruptArchive as a possible upstream problem.
 */
class DOCCHUNK_API ContainerError : public std::runtime_error
{
public:
    ContainerError(ContainerFailure failure, const std::string& message)
        : std::runtime_error(message), failure_(failure) {}

    ContainerFailure failure() const { return failure_; }

private:
    ContainerFailure failure_;
};

/**
 * @brief Read-only view of an OOXML zip package held in memory
 *
 * The archive is read through a memory-backed minizip I/O table, so opening
 * a package never touches the filesystem. An instance is not reentrant: the
 * underlying unzFile keeps a cursor, so use one container per document pass.
 */
class DOCCHUNK_API OOXMLContainer
{
public:
    /**
     * @brief Opens a package from raw bytes
     *
     * @param bytes Package contents, owned by the container from now on
     * @return The opened container
     * @throws ContainerError when the bytes are an encrypted Office package,
     *         contain encrypted entries, or are not a readable zip archive
     */
    static std::unique_ptr<OOXMLContainer> open(std::string bytes);

    ~OOXMLContainer();

    OOXMLContainer(const OOXMLContainer&) = delete;
    OOXMLContainer& operator=(const OOXMLContainer&) = delete;
    OOXMLContainer(OOXMLContainer&&) = delete;
    OOXMLContainer& operator=(OOXMLContainer&&) = delete;

    // All entry names in archive order
    const std::vector<std::string>& entries() const { return entries_; }

    bool hasPart(const std::string& path) const;

    /**
     * @brief Lists entries matching a glob pattern
     *
     * `*` matches any run of characters except `/`, `?` matches one such
     * character. Results are ordered by the last number embedded in the
     * file name, so `slide2.xml` comes before `slide10.xml`.
     */
    std::vector<std::string> listParts(const std::string& pattern) const;

    /**
     * @brief Reads the raw bytes of one entry
     *
     * @param max_bytes Inflation stops once this many bytes are read; a larger
     *        entry comes back truncated to exactly max_bytes
     * @return The bytes, or std::nullopt when the entry does not exist
     * @throws std::runtime_error when the entry exists but cannot be inflated
     */
    std::optional<std::string> readPart(const std::string& path,
                                        size_t max_bytes = std::numeric_limits<size_t>::max()) const;

    /**
     * @brief Reads and parses one XML entry
     *
     * Attributes and child elements stay in separate pugixml collections, so
     * an attribute `type` never collides with a child element `<type>`.
     *
     * @return The parsed document, or nullptr when the entry does not exist
     * @throws std::runtime_error when the entry is not well-formed XML
     */
    std::unique_ptr<pugi::xml_document> readXml(const std::string& path) const;

    // Numeric index embedded in a part file name ("ppt/slides/slide12.xml" -> 12), 0 if none
    static int partIndex(const std::string& path);

    static bool globMatch(const std::string& pattern, const std::string& path);

private:
    OOXMLContainer() = default;

    std::string bytes_;
    void* archive_ = nullptr; // unzFile
    std::vector<std::string> entries_;
};

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_OOXML_CONTAINER_HPP
