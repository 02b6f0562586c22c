#include "docchunk/retrieval/image_asset_pipeline.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <openssl/evp.h>

namespace docchunk
{
namespace retrieval
{

namespace
{
    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    bool isSafeDirectoryName(const std::string& name)
    {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
    }
}

std::string describeMimeType(const std::string& extension)
{
    if (extension == "jpg" || extension == "jpeg")
    {
        return "image/jpeg";
    }
    return "image/" + extension;
}

const char* imageSkipReasonName(ImageSkipReason reason)
{
    switch (reason)
    {
    case ImageSkipReason::None:
        return "none";
    case ImageSkipReason::TooSmall:
        return "too small";
    case ImageSkipReason::TooLarge:
        return "too large";
    case ImageSkipReason::UnsupportedType:
        return "unsupported type";
    case ImageSkipReason::NoDescription:
        return "no description";
    case ImageSkipReason::DescriberFailed:
        return "describer failed";
    case ImageSkipReason::StorageFailed:
        return "storage failed";
    }
    return "unknown";
}

FilesystemImageSink::FilesystemImageSink(std::string root) : root_(std::move(root))
{
}

std::string FilesystemImageSink::store(const std::string& document_id, int position,
                                       const std::string& extension, const std::string& bytes)
{
    if (!isSafeDirectoryName(document_id))
    {
        throw std::invalid_argument("Document id is not usable as a directory name: '" + document_id + "'");
    }

    const std::filesystem::path outputDir = std::filesystem::absolute(root_) / document_id;
    const std::filesystem::path outputPath = outputDir / (std::to_string(position) + "." + extension);
    const bool createdDir = !std::filesystem::exists(outputDir);
    try
    {
        std::filesystem::create_directories(outputDir);
        std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot open " + outputPath.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out)
        {
            throw std::runtime_error("Short write to " + outputPath.string());
        }
    }
    catch (...)
    {
        // Earlier positions of the same document stay; only this call's output goes.
        std::error_code ec;
        std::filesystem::remove(outputPath, ec);
        if (createdDir)
        {
            std::filesystem::remove_all(outputDir, ec);
        }
        throw;
    }

    return outputPath.string();
}

ImageAssetPipeline::ImageAssetPipeline(Config config, std::shared_ptr<ImageDescriber> describer,
                                       std::shared_ptr<ImageSink> sink)
    : config_(std::move(config)), describer_(std::move(describer)), sink_(std::move(sink))
{
    if (!sink_)
    {
        throw std::invalid_argument("ImageAssetPipeline requires an image sink");
    }
}

std::string ImageAssetPipeline::contentHash(const std::string& bytes)
{
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
    {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1)
    {
        throw std::runtime_error("MD5 digest failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digestLength; ++i)
    {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

bool ImageAssetPipeline::isSentinel(const std::string& description)
{
    return description == kNoDescriptionSentinel || description == kNotWorthDescribingSentinel;
}

ImageProcessResult ImageAssetPipeline::process(const std::string& bytes, const std::string& asset_path,
                                               DescriptionCache& cache, const std::string& document_id,
                                               int position, bool describe_images) const
{
    ImageProcessResult result;

    if (bytes.size() < config_.minFileSize)
    {
        PipelineLogger::logDebug("Skipping small image (%zu bytes): %s", bytes.size(), asset_path.c_str());
        result.skipReason = ImageSkipReason::TooSmall;
        return result;
    }

    if (bytes.size() > config_.maxFileSize)
    {
        PipelineLogger::logWarning("Skipping large image (%.2f MB): %s",
                                   static_cast<double>(bytes.size()) / (1024.0 * 1024.0), asset_path.c_str());
        result.skipReason = ImageSkipReason::TooLarge;
        return result;
    }

    const std::string extension = file_extension(asset_path);
    const std::string typeName = "image/" + extension;
    if (extension.empty() || config_.supportedTypes.count(typeName) == 0)
    {
        PipelineLogger::logWarning("Unsupported image format: .%s. Skipping image: %s",
                                   extension.c_str(), asset_path.c_str());
        result.skipReason = ImageSkipReason::UnsupportedType;
        return result;
    }
    const std::string mimeType = describeMimeType(extension);

    std::string description;
    if (!describe_images || !describer_)
    {
        description = config_.genericDescription;
    }
    else
    {
        std::string hash;
        try
        {
            hash = contentHash(bytes);
        }
        catch (const std::exception& ex)
        {
            PipelineLogger::logWarning("Failed to hash image %s: %s", asset_path.c_str(), ex.what());
            result.skipReason = ImageSkipReason::DescriberFailed;
            return result;
        }

        auto cached = cache.find(hash);
        if (cached != cache.end())
        {
            description = cached->second;
            result.reusedDescription = true;
            PipelineLogger::logDebug("Reusing description for repeated image %s", asset_path.c_str());
        }
        else
        {
            try
            {
                description = describer_->describe(bytes, mimeType);
            }
            catch (const std::exception& ex)
            {
                PipelineLogger::logWarning("Image description failed for %s: %s", asset_path.c_str(), ex.what());
                result.skipReason = ImageSkipReason::DescriberFailed;
                return result;
            }
            cache.emplace(hash, description);
        }

        if (isSentinel(description) || trim_copy(description).empty())
        {
            const std::string reason = trim_copy(description).empty() ? kNoDescriptionSentinel : description;
            PipelineLogger::logWarning("%s %s", reason.c_str(), asset_path.c_str());
            result.skipReason = ImageSkipReason::NoDescription;
            return result;
        }
    }

    try
    {
        result.storedPath = sink_->store(document_id, position, extension, bytes);
        PipelineLogger::logInfo("Saved image to: %s", result.storedPath.c_str());
    }
    catch (const std::exception& ex)
    {
        PipelineLogger::logError("Failed to save image %s: %s", asset_path.c_str(), ex.what());
        result.skipReason = ImageSkipReason::StorageFailed;
        return result;
    }

    result.success = true;
    result.description = std::move(description);
    return result;
}

} // namespace retrieval
} // namespace docchunk
