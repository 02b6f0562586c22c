#include "docchunk/pipeline_config.hpp"
#include "docchunk/logger.hpp"
#include "docchunk/utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace docchunk
{
    namespace
    {
        // Accepts both "png" and "image/png"
        std::string normalizeImageType(const std::string& type)
        {
            std::string lowered = to_lower_copy(trim_copy(type));
            if (lowered.find('/') == std::string::npos)
            {
                return "image/" + lowered;
            }
            return lowered;
        }

        bool isKnownLogLevel(const std::string& level)
        {
            std::string upper = level;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return upper == "DEBUG" || upper == "INFO" || upper == "WARN" || upper == "WARNING" || upper == "ERROR";
        }
    }

    bool PipelineConfig::loadFromArgs(int argc, char* argv[])
    {
        // The config file is applied first so that flags override it
        std::string configFile;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            {
                configFile = argv[i + 1];
                break;
            }
        }

        if (!configFile.empty())
        {
            if (!loadFromFile(configFile))
            {
                return false;
            }
        }
        else if (std::filesystem::exists("config.yaml"))
        {
            if (!loadFromFile("config.yaml"))
            {
                return false;
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            {
                ++i; // already loaded
            }
            else if (arg == "--doc-id" && i + 1 < argc)
            {
                documentId = argv[++i];
            }
            else if ((arg == "-o" || arg == "--output") && i + 1 < argc)
            {
                outputPath = argv[++i];
            }
            else if (arg == "--extract-images")
            {
                extractImages = true;
            }
            else if (arg == "--describe-images")
            {
                describeImages = true;
            }
            else if (arg == "--log-level" && i + 1 < argc)
            {
                logLevel = argv[++i];
            }
            else if (arg == "--log-file" && i + 1 < argc)
            {
                logFile = argv[++i];
            }
            else if (arg == "--quiet")
            {
                quietMode = true;
            }
            else if (arg == "--image-dir" && i + 1 < argc)
            {
                imageStorageRoot = argv[++i];
            }
            else if (arg == "--max-chunk-bytes" && i + 1 < argc)
            {
                try
                {
                    chunking.maxChunkBytes = std::stoi(argv[++i]);
                }
                catch (const std::exception&)
                {
                    std::cerr << "Invalid value for --max-chunk-bytes: " << argv[i] << std::endl;
                    return false;
                }
            }
            else if (arg == "-h" || arg == "--help")
            {
                printHelp();
                helpShown = true;
                return false;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
            else if (inputPath.empty())
            {
                inputPath = arg;
            }
            else
            {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
        }

        if (inputPath.empty())
        {
            std::cerr << "Error: No input file given" << std::endl;
            return false;
        }

        if (documentId.empty())
        {
            documentId = std::filesystem::path(inputPath).stem().string();
        }

        return validate();
    }

    bool PipelineConfig::loadFromFile(const std::string& configFile)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(configFile);

            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = logging["level"].as<std::string>();
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["quiet_mode"])
                    quietMode = logging["quiet_mode"].as<bool>();
            }

            if (config["chunking"])
            {
                auto chunkingNode = config["chunking"];
                if (chunkingNode["max_chunk_bytes"])
                    chunking.maxChunkBytes = chunkingNode["max_chunk_bytes"].as<int>();
                if (chunkingNode["overlap_bytes"])
                    chunking.overlapBytes = chunkingNode["overlap_bytes"].as<int>();
                if (chunkingNode["cross_image_overlap_bytes"])
                    chunking.crossImageOverlapBytes = chunkingNode["cross_image_overlap_bytes"].as<size_t>();
                if (chunkingNode["max_text_length"])
                    chunking.maxTextLength = chunkingNode["max_text_length"].as<size_t>();
            }

            if (config["images"])
            {
                auto imagesNode = config["images"];
                if (imagesNode["min_file_size"])
                    images.minFileSize = imagesNode["min_file_size"].as<size_t>();
                if (imagesNode["max_file_size_mb"])
                    images.maxFileSize = imagesNode["max_file_size_mb"].as<size_t>() * 1024 * 1024;
                if (imagesNode["supported_types"] && imagesNode["supported_types"].IsSequence())
                {
                    images.supportedTypes.clear();
                    for (const auto& type : imagesNode["supported_types"])
                    {
                        images.supportedTypes.insert(normalizeImageType(type.as<std::string>()));
                    }
                }
                if (imagesNode["storage_root"])
                    imageStorageRoot = imagesNode["storage_root"].as<std::string>();
                if (imagesNode["generic_description"])
                    images.genericDescription = imagesNode["generic_description"].as<std::string>();
            }

            if (config["caption"])
            {
                auto captionNode = config["caption"];
                if (captionNode["enabled"])
                    caption.enabled = captionNode["enabled"].as<bool>();
                if (captionNode["endpoint"])
                    caption.client.endpoint = captionNode["endpoint"].as<std::string>();
                if (captionNode["model"])
                    caption.client.model = captionNode["model"].as<std::string>();
                if (captionNode["api_key"])
                    caption.client.apiKey = captionNode["api_key"].as<std::string>();
                if (captionNode["timeout"])
                    caption.client.timeout = captionNode["timeout"].as<int>();
                if (captionNode["max_tokens"])
                    caption.client.maxTokens = captionNode["max_tokens"].as<int>();
                if (captionNode["prompt"])
                    caption.client.prompt = captionNode["prompt"].as<std::string>();
            }

            currentConfigFilePath = configFile;
            return true;
        }
        catch (const YAML::Exception& e)
        {
            std::cerr << "Error parsing config file " << configFile << ": " << e.what() << std::endl;
            return false;
        }
    }

    bool PipelineConfig::validate() const
    {
        bool valid = true;

        if (!isKnownLogLevel(logLevel))
        {
            PipelineLogger::logError("Invalid log level: %s", logLevel.c_str());
            valid = false;
        }

        if (chunking.maxChunkBytes <= 0)
        {
            PipelineLogger::logError("max_chunk_bytes must be positive");
            valid = false;
        }
        if (chunking.overlapBytes < 0)
        {
            PipelineLogger::logError("overlap_bytes cannot be negative");
            valid = false;
        }
        else if (chunking.overlapBytes >= chunking.maxChunkBytes)
        {
            PipelineLogger::logError("overlap_bytes (%d) must be smaller than max_chunk_bytes (%d)",
                                     chunking.overlapBytes, chunking.maxChunkBytes);
            valid = false;
        }

        if (images.minFileSize > images.maxFileSize)
        {
            PipelineLogger::logError("images.min_file_size exceeds images.max_file_size_mb");
            valid = false;
        }
        if (images.supportedTypes.empty())
        {
            PipelineLogger::logError("images.supported_types cannot be empty");
            valid = false;
        }
        if (imageStorageRoot.empty())
        {
            PipelineLogger::logError("images.storage_root cannot be empty");
            valid = false;
        }

        if (caption.client.timeout <= 0)
        {
            PipelineLogger::logError("caption.timeout must be positive");
            valid = false;
        }
        if (caption.enabled && caption.client.endpoint.empty())
        {
            PipelineLogger::logError("caption.endpoint is required when captioning is enabled");
            valid = false;
        }

        return valid;
    }

    void PipelineConfig::applyLogging() const
    {
        auto& logger = PipelineLogger::instance();
        logger.setLevel(PipelineLogger::levelFromString(logLevel));
        logger.setQuietMode(quietMode);
        if (!logFile.empty() && !logger.setLogFile(logFile))
        {
            logger.warning("Continuing with console logging only");
        }
    }

    void PipelineConfig::printSummary() const
    {
        std::cerr << "=== docchunk Configuration ===" << std::endl;
        std::cerr << "Logging:" << std::endl;
        std::cerr << "  Level: " << logLevel << std::endl;
        std::cerr << "  File: " << (logFile.empty() ? "Console" : logFile) << std::endl;

        std::cerr << "\nChunking:" << std::endl;
        std::cerr << "  Max Chunk Bytes: " << chunking.maxChunkBytes << std::endl;
        std::cerr << "  Overlap Bytes: " << chunking.overlapBytes << std::endl;
        std::cerr << "  Cross-Image Overlap Bytes: " << chunking.crossImageOverlapBytes << std::endl;
        std::cerr << "  Max Text Length: " << chunking.maxTextLength << std::endl;

        std::cerr << "\nImages:" << std::endl;
        std::cerr << "  Extract: " << (extractImages ? "Yes" : "No") << std::endl;
        std::cerr << "  Describe: " << (describeImages ? "Yes" : "No") << std::endl;
        std::cerr << "  Size Range: " << images.minFileSize << " - " << images.maxFileSize << " bytes" << std::endl;
        std::cerr << "  Supported Types: " << images.supportedTypes.size() << " configured" << std::endl;
        std::cerr << "  Storage Root: " << imageStorageRoot << std::endl;

        std::cerr << "\nCaptioning: " << (caption.enabled ? "Enabled" : "Disabled") << std::endl;
        if (caption.enabled)
        {
            std::cerr << "  Endpoint: " << caption.client.endpoint << std::endl;
            std::cerr << "  Model: " << (caption.client.model.empty() ? "(server default)" : caption.client.model) << std::endl;
            std::cerr << "  Timeout: " << caption.client.timeout << "s" << std::endl;
        }
        std::cerr << "==============================" << std::endl;
    }

    void PipelineConfig::printHelp()
    {
        std::cout << "docchunk - Presentation and text chunking for search indexing\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    docchunk [OPTIONS] INPUT\n\n";
        std::cout << "    INPUT ending in .pptx or .pptm is processed as a presentation,\n";
        std::cout << "    anything else as plain text.\n\n";
        std::cout << "OPTIONS:\n";
        std::cout << "    -c, --config FILE         Load configuration from YAML file (default: ./config.yaml)\n";
        std::cout << "    --doc-id ID               Document identifier (default: input file name)\n";
        std::cout << "    --extract-images          Emit image chunks and store the images\n";
        std::cout << "    --describe-images         Caption images through the configured endpoint\n";
        std::cout << "    --image-dir DIR           Image storage root (default: downloads/docchunk_images)\n";
        std::cout << "    --max-chunk-bytes N       Chunk size budget in bytes (default: 512)\n";
        std::cout << "    -o, --output FILE         Write the JSON result to FILE instead of stdout\n";
        std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARNING, ERROR (default: INFO)\n";
        std::cout << "    --log-file FILE           Also append log lines to FILE\n";
        std::cout << "    --quiet                   Suppress INFO messages\n";
        std::cout << "    -h, --help                Show this help message\n\n";
        std::cout << "EXIT CODES:\n";
        std::cout << "    0  Success (an empty result means the document is not indexable)\n";
        std::cout << "    1  Usage or configuration error\n";
        std::cout << "    2  Input could not be read\n";
    }

} // namespace docchunk
