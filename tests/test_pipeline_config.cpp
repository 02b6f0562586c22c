#include "test_common.h"
#include "docchunk/pipeline_config.hpp"
#include <cstdio>
#include <fstream>

using docchunk::PipelineConfig;

static bool write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return static_cast<bool>(out);
}

int main() {
    quiet_logs();

    PipelineConfig defaults;
    if (!defaults.validate()) return fail(64, "defaults must validate");
    if (defaults.chunking.maxChunkBytes != 512 || defaults.chunking.overlapBytes != 128 ||
        defaults.chunking.crossImageOverlapBytes != 32 || defaults.images.minFileSize != 10000)
        return fail(65, "unexpected defaults");

    const std::string path = "pipeline_config_test.yaml";
    if (!write_file(path,
        "logging:\n"
        "  level: WARNING\n"
        "  quiet_mode: true\n"
        "chunking:\n"
        "  max_chunk_bytes: 256\n"
        "  overlap_bytes: 64\n"
        "  cross_image_overlap_bytes: 16\n"
        "  max_text_length: 100000\n"
        "images:\n"
        "  min_file_size: 2048\n"
        "  max_file_size_mb: 2\n"
        "  supported_types: [png, image/JPEG]\n"
        "  storage_root: /tmp/docchunk-images\n"
        "caption:\n"
        "  enabled: true\n"
        "  endpoint: http://captioner:8000/v1/chat/completions\n"
        "  model: vision-small\n"
        "  timeout: 5\n"))
        return fail(66, "cannot write fixture");

    PipelineConfig config;
    if (!config.loadFromFile(path)) return fail(67, "config file not loaded");
    if (config.logLevel != "WARNING" || !config.quietMode) return fail(68, "logging section");
    if (config.chunking.maxChunkBytes != 256 || config.chunking.overlapBytes != 64 ||
        config.chunking.crossImageOverlapBytes != 16 || config.chunking.maxTextLength != 100000)
        return fail(69, "chunking section");
    if (config.images.minFileSize != 2048 || config.images.maxFileSize != 2u * 1024 * 1024) return fail(70, "image sizes");
    if (config.images.supportedTypes != std::set<std::string>({"image/png", "image/jpeg"})) return fail(71, "supported types");
    if (config.imageStorageRoot != "/tmp/docchunk-images") return fail(72, "storage root");
    if (!config.caption.enabled || config.caption.client.model != "vision-small" || config.caption.client.timeout != 5)
        return fail(73, "caption section");
    if (config.currentConfigFilePath != path) return fail(74, "config path not recorded");
    if (!config.validate()) return fail(75, "loaded config must validate");

    // Validation rules
    PipelineConfig bad = config;
    bad.chunking.overlapBytes = bad.chunking.maxChunkBytes;
    if (bad.validate()) return fail(76, "overlap >= max accepted");
    bad = config; bad.chunking.maxChunkBytes = 0;
    if (bad.validate()) return fail(77, "zero chunk size accepted");
    bad = config; bad.images.minFileSize = bad.images.maxFileSize + 1;
    if (bad.validate()) return fail(78, "min > max image size accepted");
    bad = config; bad.imageStorageRoot.clear();
    if (bad.validate()) return fail(79, "empty storage root accepted");
    bad = config; bad.images.supportedTypes.clear();
    if (bad.validate()) return fail(80, "empty type set accepted");
    bad = config; bad.caption.client.timeout = 0;
    if (bad.validate()) return fail(81, "zero timeout accepted");
    bad = config; bad.logLevel = "LOUD";
    if (bad.validate()) return fail(82, "unknown log level accepted");

    // Unreadable and malformed files
    PipelineConfig missing;
    if (missing.loadFromFile("does_not_exist.yaml")) return fail(83, "missing file accepted");
    write_file("pipeline_config_broken.yaml", "chunking: [unclosed\n");
    if (missing.loadFromFile("pipeline_config_broken.yaml")) return fail(84, "malformed YAML accepted");

    // Command line overrides the file
    {
        const char *argv[] = {"docchunk", "--config", path.c_str(), "--doc-id", "deck-7", "--extract-images",
                              "--log-level", "DEBUG", "--max-chunk-bytes", "300", "slides.pptx"};
        PipelineConfig args;
        if (!args.loadFromArgs(11, const_cast<char **>(argv))) return fail(85, "valid arguments rejected");
        if (args.inputPath != "slides.pptx" || args.documentId != "deck-7") return fail(86, "input or doc id");
        if (!args.extractImages || args.describeImages) return fail(87, "image flags");
        if (args.logLevel != "DEBUG" || args.chunking.maxChunkBytes != 300 || args.chunking.overlapBytes != 64)
            return fail(88, "flags must override the file");
    }
    {
        const char *argv[] = {"docchunk", "--config", path.c_str(), "reports/q3.pptx"};
        PipelineConfig args;
        if (!args.loadFromArgs(4, const_cast<char **>(argv)) || args.documentId != "q3") return fail(89, "default doc id");
    }
    {
        const char *argv[] = {"docchunk", "--config", path.c_str()};
        PipelineConfig args;
        if (args.loadFromArgs(3, const_cast<char **>(argv))) return fail(90, "missing input accepted");
    }
    {
        const char *argv[] = {"docchunk", "--config", path.c_str(), "--frobnicate", "a.pptx"};
        PipelineConfig args;
        if (args.loadFromArgs(5, const_cast<char **>(argv))) return fail(91, "unknown option accepted");
    }
    {
        const char *argv[] = {"docchunk", "--help"};
        PipelineConfig args;
        if (args.loadFromArgs(2, const_cast<char **>(argv)) || !args.helpShown) return fail(92, "help not handled");
    }

    std::remove(path.c_str());
    std::remove("pipeline_config_broken.yaml");
    std::cout << "[TEST] OK pipeline config\n";
    return 0;
}
