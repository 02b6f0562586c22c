#pragma once

#include "export.hpp"
#include "retrieval/caption_client.hpp"
#include "retrieval/document_chunk_assembler.hpp"
#include "retrieval/image_asset_pipeline.hpp"
#include <string>

namespace docchunk
{

/**
 * @brief Captioning collaborator settings
 */
struct CaptionConfig
{
    bool enabled = false;                  // Whether --describe-images may call the endpoint
    retrieval::HttpImageDescriber::Config client;
};

/**
 * @brief Runtime configuration of the chunking pipeline and its CLI
 */
struct DOCCHUNK_API PipelineConfig
{
    // Logging configuration
    std::string logLevel = "INFO";        // DEBUG, INFO, WARNING, ERROR
    std::string logFile = "";             // Empty means console only
    bool quietMode = false;               // Suppress routine operational messages

    // Chunk sizes and the per-document text budget
    retrieval::DocumentChunkAssembler::Config chunking;

    // Image gate and storage
    retrieval::ImageAssetPipeline::Config images;
    std::string imageStorageRoot = "downloads/docchunk_images";

    CaptionConfig caption;

    // Per-invocation settings, command line only
    std::string inputPath;
    std::string outputPath;               // Empty means stdout
    std::string documentId;               // Defaults to the input file stem
    bool extractImages = false;
    bool describeImages = false;

    // Internal flags
    bool helpShown = false;               // Tracks if help was displayed
    std::string currentConfigFilePath;    // Path of the loaded config file, empty when none

    PipelineConfig() = default;

    /**
     * @brief Load configuration from command line arguments
     *
     * A file named by --config is loaded first, otherwise ./config.yaml when
     * present; flags then override it.
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return True if the arguments were complete and the result validates
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from a YAML file
     * @param configFile Path to the configuration file
     * @return True if the file was read and parsed
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Validate the configuration, logging every problem found
     */
    bool validate() const;

    // Push the logging settings into PipelineLogger
    void applyLogging() const;

    void printSummary() const;

    static void printHelp();
};

} // namespace docchunk
