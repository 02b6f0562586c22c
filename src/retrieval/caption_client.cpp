#include "docchunk/retrieval/caption_client.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>
#include <curl/curl.h>
#include <openssl/evp.h>

namespace docchunk
{
namespace retrieval
{

namespace
{
    size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp)
    {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    struct CurlDeleter
    {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct HeaderListDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
}

CurlGlobalScope::CurlGlobalScope()
{
    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK)
    {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
    }
}

CurlGlobalScope::~CurlGlobalScope()
{
    curl_global_cleanup();
}

HttpImageDescriber::HttpImageDescriber(Config config) : config_(std::move(config))
{
    PipelineLogger::logInfo("HttpImageDescriber initialized - Endpoint: %s, Model: %s",
                            config_.endpoint.c_str(), config_.model.c_str());
}

HttpImageDescriber::~HttpImageDescriber() = default;

std::string HttpImageDescriber::base64Encode(const std::string& bytes)
{
    if (bytes.empty())
    {
        return "";
    }

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a terminator
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                                        static_cast<int>(bytes.size()));
    if (written < 0)
    {
        throw std::runtime_error("Base64 encoding failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

nlohmann::json HttpImageDescriber::buildRequest(const std::string& bytes, const std::string& mime_type) const
{
    nlohmann::json imagePart;
    imagePart["type"] = "image_url";
    imagePart["image_url"]["url"] = "data:" + mime_type + ";base64," + base64Encode(bytes);

    nlohmann::json textPart;
    textPart["type"] = "text";
    textPart["text"] = config_.prompt;

    nlohmann::json message;
    message["role"] = "user";
    message["content"] = nlohmann::json::array({textPart, imagePart});

    nlohmann::json request;
    if (!config_.model.empty())
    {
        request["model"] = config_.model;
    }
    request["messages"] = nlohmann::json::array({message});
    request["max_tokens"] = config_.maxTokens;
    request["stream"] = false;
    return request;
}

std::string HttpImageDescriber::parseResponse(const std::string& body)
{
    nlohmann::json response;
    try
    {
        response = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        throw std::runtime_error(std::string("Invalid JSON from caption endpoint: ") + ex.what());
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty())
    {
        throw std::runtime_error("Caption response has no choices");
    }

    const auto& first = response["choices"][0];
    if (!first.contains("message") || !first["message"].contains("content"))
    {
        throw std::runtime_error("Caption response has no message content");
    }

    const auto& content = first["message"]["content"];
    if (content.is_null())
    {
        return kNoDescriptionSentinel;
    }
    if (!content.is_string())
    {
        throw std::runtime_error("Caption response content is not a string");
    }

    std::string text = trim_copy(content.get<std::string>());
    return text.empty() ? std::string(kNoDescriptionSentinel) : text;
}

std::string HttpImageDescriber::describe(const std::string& bytes, const std::string& mime_type)
{
    const std::string body = buildRequest(bytes, mime_type).dump();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
    {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_slist* rawHeaders = curl_slist_append(nullptr, "Content-Type: application/json");
    if (!config_.apiKey.empty())
    {
        rawHeaders = curl_slist_append(rawHeaders, ("Authorization: Bearer " + config_.apiKey).c_str());
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(rawHeaders);

    std::string responseBody;
    curl_easy_setopt(curl.get(), CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "docchunk/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
    {
        throw std::runtime_error("Caption request failed: " + std::string(curl_easy_strerror(res)));
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
    if (responseCode < 200 || responseCode >= 300)
    {
        throw std::runtime_error("Caption endpoint returned HTTP " + std::to_string(responseCode));
    }

    std::string description = parseResponse(responseBody);
    PipelineLogger::logDebug("Caption endpoint returned %zu bytes of description", description.size());
    return description;
}

} // namespace retrieval
} // namespace docchunk
