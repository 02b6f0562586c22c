#ifndef DOCCHUNK_CAPTION_CLIENT_HPP
#define DOCCHUNK_CAPTION_CLIENT_HPP

#include "../export.hpp"
#include "image_asset_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Process-wide libcurl setup
 *
 * curl_global_init/curl_global_cleanup are not thread-safe, so they run once
 * here. Construct one in main before any HttpImageDescriber and keep it alive
 * until every describer is gone.
 */
class DOCCHUNK_API CurlGlobalScope
{
public:
    CurlGlobalScope();
    ~CurlGlobalScope();

    CurlGlobalScope(const CurlGlobalScope&) = delete;
    CurlGlobalScope& operator=(const CurlGlobalScope&) = delete;
};

/**
 * @brief Describes images through an OpenAI-compatible chat completions endpoint
 *
 * The image is sent inline as a base64 data URL next to the instruction
 * prompt. The request is bounded by the configured timeout; transport
 * failures, non-2xx responses and malformed bodies throw std::runtime_error.
 * An empty completion maps to kNoDescriptionSentinel.
 */
class DOCCHUNK_API HttpImageDescriber : public ImageDescriber
{
public:
    struct Config
    {
        std::string endpoint = "http://localhost:8080/v1/chat/completions";
        std::string model;
        std::string apiKey;
        int timeout = 60; // seconds
        int maxTokens = 512;
        std::string prompt =
            "Describe the content of this image in detail so it can be found by text search. "
            "Transcribe any visible text, labels and numbers. If the image is decorative or has no "
            "informational value (a logo, a divider, a background), reply with exactly: "
            "Image is not worth describing.";
    };

    explicit HttpImageDescriber(Config config);
    ~HttpImageDescriber() override;

    HttpImageDescriber(const HttpImageDescriber&) = delete;
    HttpImageDescriber& operator=(const HttpImageDescriber&) = delete;

    std::string describe(const std::string& bytes, const std::string& mime_type) override;

    // Request body for one image, exposed for tests
    nlohmann::json buildRequest(const std::string& bytes, const std::string& mime_type) const;

    /**
     * @brief Pulls the completion text out of a chat completions response
     *
     * @throws std::runtime_error when the body has no choices[0].message.content
     */
    static std::string parseResponse(const std::string& body);

    static std::string base64Encode(const std::string& bytes);

private:
    Config config_;
};

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_CAPTION_CLIENT_HPP
