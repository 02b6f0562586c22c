#include "docchunk/retrieval/ooxml_container.hpp"
#include "docchunk/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <unzip.h>

namespace docchunk
{
namespace retrieval
{

namespace
{
    // Encrypted OOXML packages are stored as OLE compound files, not zips
    const unsigned char kCompoundFileSignature[] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

    // General purpose bit 0: entry is encrypted
    constexpr uLong kEncryptedEntryFlag = 0x1;

    struct MemoryStream
    {
        const std::string* data;
        ZPOS64_T position;
    };

    voidpf ZCALLBACK memoryOpen(voidpf opaque, const void* /*filename*/, int /*mode*/)
    {
        return new MemoryStream{static_cast<const std::string*>(opaque), 0};
    }

    uLong ZCALLBACK memoryRead(voidpf /*opaque*/, voidpf stream, void* buf, uLong size)
    {
        auto* ms = static_cast<MemoryStream*>(stream);
        const ZPOS64_T total = ms->data->size();
        if (ms->position >= total)
        {
            return 0;
        }
        const ZPOS64_T available = total - ms->position;
        const uLong count = static_cast<uLong>(std::min<ZPOS64_T>(available, size));
        std::memcpy(buf, ms->data->data() + ms->position, count);
        ms->position += count;
        return count;
    }

    uLong ZCALLBACK memoryWrite(voidpf /*opaque*/, voidpf /*stream*/, const void* /*buf*/, uLong /*size*/)
    {
        return 0;
    }

    ZPOS64_T ZCALLBACK memoryTell(voidpf /*opaque*/, voidpf stream)
    {
        return static_cast<MemoryStream*>(stream)->position;
    }

    long ZCALLBACK memorySeek(voidpf /*opaque*/, voidpf stream, ZPOS64_T offset, int origin)
    {
        auto* ms = static_cast<MemoryStream*>(stream);
        const ZPOS64_T total = ms->data->size();
        ZPOS64_T target = 0;
        switch (origin)
        {
        case ZLIB_FILEFUNC_SEEK_SET:
            target = offset;
            break;
        case ZLIB_FILEFUNC_SEEK_CUR:
            target = ms->position + offset;
            break;
        case ZLIB_FILEFUNC_SEEK_END:
            target = total + offset;
            break;
        default:
            return -1;
        }
        if (target > total)
        {
            return -1;
        }
        ms->position = target;
        return 0;
    }

    int ZCALLBACK memoryClose(voidpf /*opaque*/, voidpf stream)
    {
        delete static_cast<MemoryStream*>(stream);
        return 0;
    }

    int ZCALLBACK memoryError(voidpf /*opaque*/, voidpf /*stream*/)
    {
        return 0;
    }

    bool isCompoundFile(const std::string& bytes)
    {
        return bytes.size() >= sizeof(kCompoundFileSignature) &&
               std::memcmp(bytes.data(), kCompoundFileSignature, sizeof(kCompoundFileSignature)) == 0;
    }
}

std::unique_ptr<OOXMLContainer> OOXMLContainer::open(std::string bytes)
{
    if (bytes.empty())
    {
        throw ContainerError(ContainerFailure::CorruptArchive, "Empty document buffer");
    }

    if (isCompoundFile(bytes))
    {
        throw ContainerError(ContainerFailure::PasswordProtected,
                             "Document is an encrypted Office package (PasswordException)");
    }

    std::unique_ptr<OOXMLContainer> container(new OOXMLContainer());
    container->bytes_ = std::move(bytes);

    zlib_filefunc64_def fileFuncs;
    fileFuncs.zopen64_file = memoryOpen;
    fileFuncs.zread_file = memoryRead;
    fileFuncs.zwrite_file = memoryWrite;
    fileFuncs.ztell64_file = memoryTell;
    fileFuncs.zseek64_file = memorySeek;
    fileFuncs.zclose_file = memoryClose;
    fileFuncs.zerror_file = memoryError;
    fileFuncs.opaque = &container->bytes_;

    unzFile archive = unzOpen2_64("memory", &fileFuncs);
    if (!archive)
    {
        throw ContainerError(ContainerFailure::CorruptArchive, "Failed to open zip archive");
    }
    container->archive_ = archive;

    int status = unzGoToFirstFile(archive);
    while (status == UNZ_OK)
    {
        unz_file_info64 info;
        if (unzGetCurrentFileInfo64(archive, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK)
        {
            throw ContainerError(ContainerFailure::CorruptArchive, "Failed to read zip entry header");
        }

        std::vector<char> name(info.size_filename + 1, '\0');
        if (unzGetCurrentFileInfo64(archive, &info, name.data(), static_cast<uLong>(name.size()),
                                    nullptr, 0, nullptr, 0) != UNZ_OK)
        {
            throw ContainerError(ContainerFailure::CorruptArchive, "Failed to read zip entry name");
        }

        std::string entryName(name.data(), info.size_filename);
        if (info.flag & kEncryptedEntryFlag)
        {
            throw ContainerError(ContainerFailure::PasswordProtected,
                                 "Zip entry '" + entryName + "' is encrypted (PasswordException)");
        }

        container->entries_.push_back(std::move(entryName));
        status = unzGoToNextFile(archive);
    }

    if (status != UNZ_END_OF_LIST_OF_FILE)
    {
        throw ContainerError(ContainerFailure::CorruptArchive, "Zip central directory is damaged");
    }

    PipelineLogger::logDebug("Opened package with %zu entries (%zu bytes)",
                             container->entries_.size(), container->bytes_.size());
    return container;
}

OOXMLContainer::~OOXMLContainer()
{
    if (archive_)
    {
        unzClose(static_cast<unzFile>(archive_));
    }
}

bool OOXMLContainer::hasPart(const std::string& path) const
{
    return std::find(entries_.begin(), entries_.end(), path) != entries_.end();
}

int OOXMLContainer::partIndex(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    // Last run of digits in the file name
    size_t end = name.size();
    while (end > 0 && !std::isdigit(static_cast<unsigned char>(name[end - 1])))
    {
        --end;
    }
    size_t start = end;
    while (start > 0 && std::isdigit(static_cast<unsigned char>(name[start - 1])))
    {
        --start;
    }
    if (start == end)
    {
        return 0;
    }

    try
    {
        return std::stoi(name.substr(start, end - start));
    }
    catch (const std::out_of_range&)
    {
        return 0;
    }
}

bool OOXMLContainer::globMatch(const std::string& pattern, const std::string& path)
{
    size_t p = 0;
    size_t s = 0;
    size_t starP = std::string::npos;
    size_t starS = 0;

    while (s < path.size())
    {
        if (p < pattern.size() && pattern[p] == '*')
        {
            starP = p++;
            starS = s;
        }
        else if (p < pattern.size() && (pattern[p] == path[s] || (pattern[p] == '?' && path[s] != '/')))
        {
            ++p;
            ++s;
        }
        else if (starP != std::string::npos && path[starS] != '/')
        {
            // Let the last '*' absorb one more character
            p = starP + 1;
            s = ++starS;
        }
        else
        {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*')
    {
        ++p;
    }
    return p == pattern.size();
}

std::vector<std::string> OOXMLContainer::listParts(const std::string& pattern) const
{
    std::vector<std::string> parts;
    for (const auto& entry : entries_)
    {
        if (globMatch(pattern, entry))
        {
            parts.push_back(entry);
        }
    }

    std::sort(parts.begin(), parts.end(), [](const std::string& a, const std::string& b)
              {
                  const int ia = partIndex(a);
                  const int ib = partIndex(b);
                  return ia != ib ? ia < ib : a < b;
              });
    return parts;
}

std::optional<std::string> OOXMLContainer::readPart(const std::string& path, size_t max_bytes) const
{
    auto archive = static_cast<unzFile>(archive_);

    // 1: case-sensitive lookup, part names in OOXML are exact
    if (unzLocateFile(archive, path.c_str(), 1) != UNZ_OK)
    {
        return std::nullopt;
    }

    unz_file_info64 info;
    if (unzGetCurrentFileInfo64(archive, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK)
    {
        throw std::runtime_error("Failed to read zip entry header: " + path);
    }

    if (unzOpenCurrentFile(archive) != UNZ_OK)
    {
        throw std::runtime_error("Failed to open zip entry: " + path);
    }

    // The declared size only sizes the buffer; the read loop enforces the cap
    std::string content;
    const size_t reserveCap = std::min<size_t>(max_bytes, 1 << 20);
    content.reserve(static_cast<size_t>(std::min<ZPOS64_T>(info.uncompressed_size, reserveCap)));

    char buffer[8192];
    int bytesRead = 0;
    bool truncated = false;
    while (content.size() < max_bytes)
    {
        const size_t want = std::min(sizeof(buffer), max_bytes - content.size());
        bytesRead = unzReadCurrentFile(archive, buffer, static_cast<unsigned>(want));
        if (bytesRead <= 0)
        {
            break;
        }
        content.append(buffer, bytesRead);
    }
    if (bytesRead >= 0 && content.size() >= max_bytes)
    {
        // Anything left means the entry is larger than the cap
        char extra;
        truncated = unzReadCurrentFile(archive, &extra, 1) > 0;
    }

    const int closeStatus = unzCloseCurrentFile(archive);

    if (bytesRead < 0)
    {
        throw std::runtime_error("Error inflating zip entry: " + path);
    }
    if (truncated)
    {
        PipelineLogger::logDebug("Zip entry %s exceeds %zu bytes, read stopped", path.c_str(), max_bytes);
        return content;
    }
    if (closeStatus == UNZ_CRCERROR)
    {
        throw std::runtime_error("CRC mismatch in zip entry: " + path);
    }

    return content;
}

std::unique_ptr<pugi::xml_document> OOXMLContainer::readXml(const std::string& path) const
{
    auto content = readPart(path);
    if (!content)
    {
        return nullptr;
    }

    auto doc = std::make_unique<pugi::xml_document>();
    pugi::xml_parse_result result = doc->load_buffer(content->data(), content->size(),
                                                     pugi::parse_default | pugi::parse_ws_pcdata);
    if (!result)
    {
        throw std::runtime_error("Failed to parse XML part '" + path + "': " + result.description());
    }
    return doc;
}

} // namespace retrieval
} // namespace docchunk
