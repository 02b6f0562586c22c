#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <csignal>
#include <atomic>
#include <memory>
#include "docchunk/pipeline_config.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include "docchunk/retrieval/caption_client.hpp"
#include "docchunk/retrieval/document_chunk_assembler.hpp"
#include "docchunk/retrieval/image_asset_pipeline.hpp"

using namespace docchunk;
using namespace docchunk::retrieval;

namespace
{
    constexpr int kExitUsage = 1;
    constexpr int kExitInput = 2;

    // Set by SIGINT/SIGTERM, checked by the assembler between slides
    std::atomic<bool> cancel_requested{false};

    void signal_handler(int)
    {
        cancel_requested = true;
    }

    bool readFile(const std::string& path, std::string& out)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            return false;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        out = buffer.str();
        return !file.bad();
    }

    bool isPresentation(const std::string& path)
    {
        const std::string ext = file_extension(path);
        return ext == "pptx" || ext == "pptm";
    }
}

int main(int argc, char *argv[])
{
    PipelineConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        if (config.helpShown)
        {
            return 0;
        }
        std::cerr << "Run with --help for usage." << std::endl;
        return kExitUsage;
    }
    config.applyLogging();

    if (config.logLevel == "DEBUG" || config.logLevel == "debug")
    {
        config.printSummary();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string bytes;
    if (!readFile(config.inputPath, bytes))
    {
        PipelineLogger::logError("Cannot read input file: %s", config.inputPath.c_str());
        return kExitInput;
    }

    // Outlives every describer below
    std::unique_ptr<CurlGlobalScope> curl;
    std::shared_ptr<ImageDescriber> describer;
    if (config.describeImages)
    {
        if (config.caption.enabled)
        {
            try
            {
                curl = std::make_unique<CurlGlobalScope>();
                describer = std::make_shared<HttpImageDescriber>(config.caption.client);
            }
            catch (const std::exception& ex)
            {
                PipelineLogger::logError("Cannot set up image captioning: %s", ex.what());
                return kExitUsage;
            }
        }
        else
        {
            PipelineLogger::logWarning("--describe-images given but captioning is disabled in the config; "
                                       "images get the generic description");
        }
    }

    auto sink = std::make_shared<FilesystemImageSink>(config.imageStorageRoot);
    auto images = std::make_shared<ImageAssetPipeline>(config.images, describer, sink);
    DocumentChunkAssembler assembler(config.chunking, images);

    ProcessingResult result;
    if (isPresentation(config.inputPath))
    {
        ProcessingOptions options;
        options.extractImages = config.extractImages;
        options.describeImages = config.describeImages && describer != nullptr;
        options.cancelFlag = &cancel_requested;
        result = assembler.processPresentation(std::move(bytes), config.documentId, options);
    }
    else
    {
        result = assembler.processText(bytes, config.documentId);
    }

    if (result.empty())
    {
        PipelineLogger::logWarning("No chunks produced for %s; the document is not indexable",
                                   config.documentId.c_str());
    }

    const std::string json = result.to_json().dump(2);
    if (config.outputPath.empty())
    {
        std::cout << json << std::endl;
    }
    else
    {
        std::ofstream out(config.outputPath, std::ios::trunc);
        if (!out.is_open())
        {
            PipelineLogger::logError("Cannot open output file: %s", config.outputPath.c_str());
            return kExitInput;
        }
        out << json << std::endl;
        PipelineLogger::logInfo("Wrote %zu text and %zu image chunks to %s", result.text_chunks.size(),
                                result.image_chunks.size(), config.outputPath.c_str());
    }

    return 0;
}
