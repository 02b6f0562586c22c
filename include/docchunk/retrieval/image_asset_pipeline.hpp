#ifndef DOCCHUNK_IMAGE_ASSET_PIPELINE_HPP
#define DOCCHUNK_IMAGE_ASSET_PIPELINE_HPP

#include "../export.hpp"
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

namespace docchunk
{
namespace retrieval
{

// Returned by a describer when the model produced nothing
inline const char* const kNoDescriptionSentinel = "No description returned.";
// Returned by a describer for decorative or content-free images
inline const char* const kNotWorthDescribingSentinel = "Image is not worth describing.";

/**
 * @brief External captioning collaborator
 *
 * Implementations may block (model inference) and may throw; a throw is
 * treated as "skip this image". Returning one of the sentinel strings also
 * skips the image.
 */
class DOCCHUNK_API ImageDescriber
{
public:
    virtual ~ImageDescriber() = default;

    virtual std::string describe(const std::string& bytes, const std::string& mime_type) = 0;
};

/**
 * @brief Destination for accepted image bytes
 */
class DOCCHUNK_API ImageSink
{
public:
    virtual ~ImageSink() = default;

    /**
     * @brief Persists one image
     *
     * @return Location the bytes were written to
     * @throws std::exception when the write fails; no partial state may remain
     */
    virtual std::string store(const std::string& document_id, int position,
                              const std::string& extension, const std::string& bytes) = 0;
};

/**
 * @brief Writes images to <root>/<document_id>/<position>.<ext>
 *
 * The document directory is created on demand. If the write fails and the
 * directory was created by this call, it is removed again before the error
 * propagates.
 */
class DOCCHUNK_API FilesystemImageSink : public ImageSink
{
public:
    explicit FilesystemImageSink(std::string root);

    std::string store(const std::string& document_id, int position,
                      const std::string& extension, const std::string& bytes) override;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

enum class ImageSkipReason
{
    None,
    TooSmall,
    TooLarge,
    UnsupportedType,
    NoDescription,
    DescriberFailed,
    StorageFailed
};

DOCCHUNK_API const char* imageSkipReasonName(ImageSkipReason reason);

/// @brief MIME type sent to a describer for a file extension; jpg and jpeg both map to image/jpeg.
DOCCHUNK_API std::string describeMimeType(const std::string& extension);

struct ImageProcessResult
{
    bool success = false;
    ImageSkipReason skipReason = ImageSkipReason::None;
    std::string description;
    std::string storedPath;
    bool reusedDescription = false;
};

// content hash -> description (sentinels included), one map per document run
using DescriptionCache = std::unordered_map<std::string, std::string>;

/**
 * @brief Validates, deduplicates, describes and persists embedded images
 */
class DOCCHUNK_API ImageAssetPipeline
{
public:
    struct Config
    {
        size_t minFileSize = 10000;               // smaller images are logos and decoration
        size_t maxFileSize = 15 * 1024 * 1024;    // bytes
        std::set<std::string> supportedTypes = {"image/png", "image/jpeg", "image/jpg", "image/webp", "image/gif"};
        std::string genericDescription = "Image embedded in the document.";
    };

    /**
     * @param config Size limits, MIME allow-list and the placeholder description
     * @param describer Captioning collaborator; may be null, in which case
     *        every image gets the generic description
     * @param sink Persistence target, required
     */
    ImageAssetPipeline(Config config, std::shared_ptr<ImageDescriber> describer, std::shared_ptr<ImageSink> sink);

    /**
     * @brief Runs one image through the gate, the dedupe cache and the sink
     *
     * Gate order: too small, too large, unsupported extension. Each failure is
     * a logged skip. An image whose hash is already cached reuses the cached
     * description without calling the describer; a cached sentinel skips it
     * again. Never throws.
     *
     * @param bytes Raw image bytes
     * @param asset_path Package path, used for the extension and log lines
     * @param cache Per-document description cache
     * @param document_id Directory name under the sink root
     * @param position Global chunk position the image will occupy
     * @param describe_images When false the describer is not called and the
     *        generic description is used
     */
    ImageProcessResult process(const std::string& bytes, const std::string& asset_path, DescriptionCache& cache,
                               const std::string& document_id, int position, bool describe_images) const;

    const Config& config() const { return config_; }

    // Lowercase hex MD5 of the bytes
    static std::string contentHash(const std::string& bytes);

    static bool isSentinel(const std::string& description);

private:
    Config config_;
    std::shared_ptr<ImageDescriber> describer_;
    std::shared_ptr<ImageSink> sink_;
};

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_IMAGE_ASSET_PIPELINE_HPP
