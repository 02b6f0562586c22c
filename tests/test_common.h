#pragma once
#include "docchunk/logger.hpp"
#include "docchunk/retrieval/image_asset_pipeline.hpp"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

inline int fail(int code, const std::string &message) {
    std::cerr << "[TEST] " << message << std::endl;
    return code;
}

inline void quiet_logs() {
    PipelineLogger::instance().setConsoleOutput(false);
    PipelineLogger::instance().setLevel(LogLevel::PIPELINE_DEBUG);
    PipelineLogger::instance().clearLogs();
}

inline bool has_log(LogLevel level, const std::string &fragment) {
    for (const auto &entry : PipelineLogger::instance().getLogs()) {
        if (entry.level == level && entry.message.find(fragment) != std::string::npos) return true;
    }
    return false;
}

// Writes an uncompressed zip archive in memory; enough for minizip to read back
class StoredZip {
public:
    StoredZip &add(const std::string &name, const std::string &data) { entries_.push_back({name, data}); return *this; }
    StoredZip &encrypted(bool on = true) { encrypted_ = on; return *this; }

    std::string build() const {
        std::string out, central;
        const uint16_t flags = encrypted_ ? 0x1 : 0x0;
        for (const auto &e : entries_) {
            const uint32_t offset = static_cast<uint32_t>(out.size());
            const uint32_t crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0),
                reinterpret_cast<const Bytef *>(e.second.data()), static_cast<uInt>(e.second.size())));
            const uint32_t size = static_cast<uint32_t>(e.second.size());

            put32(out, 0x04034b50); put16(out, 20); put16(out, flags); put16(out, 0);
            put16(out, 0); put16(out, 0x21); put32(out, crc); put32(out, size); put32(out, size);
            put16(out, static_cast<uint16_t>(e.first.size())); put16(out, 0);
            out += e.first; out += e.second;

            put32(central, 0x02014b50); put16(central, 20); put16(central, 20); put16(central, flags); put16(central, 0);
            put16(central, 0); put16(central, 0x21); put32(central, crc); put32(central, size); put32(central, size);
            put16(central, static_cast<uint16_t>(e.first.size())); put16(central, 0); put16(central, 0);
            put16(central, 0); put16(central, 0); put32(central, 0); put32(central, offset);
            central += e.first;
        }
        const uint32_t centralOffset = static_cast<uint32_t>(out.size());
        out += central;
        put32(out, 0x06054b50); put16(out, 0); put16(out, 0);
        put16(out, static_cast<uint16_t>(entries_.size())); put16(out, static_cast<uint16_t>(entries_.size()));
        put32(out, static_cast<uint32_t>(central.size())); put32(out, centralOffset); put16(out, 0);
        return out;
    }

private:
    static void put16(std::string &s, uint16_t v) { s.push_back(char(v & 0xff)); s.push_back(char((v >> 8) & 0xff)); }
    static void put32(std::string &s, uint32_t v) { put16(s, uint16_t(v & 0xffff)); put16(s, uint16_t(v >> 16)); }

    std::vector<std::pair<std::string, std::string>> entries_;
    bool encrypted_ = false;
};

// Minimal PresentationML builders
namespace slidexml {
    inline std::string doc(const std::string &shapes) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
               "<p:sld xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
               "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
               "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\" "
               "xmlns:c=\"http://schemas.openxmlformats.org/drawingml/2006/chart\">"
               "<p:cSld><p:spTree><p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
               + shapes + "</p:spTree></p:cSld></p:sld>";
    }

    inline std::string para(const std::string &text) {
        return "<a:p><a:r><a:rPr lang=\"en-US\"/><a:t>" + text + "</a:t></a:r></a:p>";
    }

    inline std::string shape(const std::string &placeholderType, const std::string &paragraphs, bool placeholder = true) {
        std::string nvPr = placeholder
            ? (placeholderType.empty() ? "<p:nvPr><p:ph idx=\"1\"/></p:nvPr>" : "<p:nvPr><p:ph type=\"" + placeholderType + "\"/></p:nvPr>")
            : "<p:nvPr/>";
        return "<p:sp><p:nvSpPr><p:cNvPr id=\"2\" name=\"Shape\"/><p:cNvSpPr/>" + nvPr + "</p:nvSpPr>"
               "<p:spPr/><p:txBody><a:bodyPr/><a:lstStyle/>" + paragraphs + "</p:txBody></p:sp>";
    }

    inline std::string picture(const std::string &relId) {
        return "<p:pic><p:nvPicPr><p:cNvPr id=\"4\" name=\"Picture\"/><p:cNvPicPr/><p:nvPr/></p:nvPicPr>"
               "<p:blipFill><a:blip r:embed=\"" + relId + "\"/><a:stretch><a:fillRect/></a:stretch></p:blipFill>"
               "<p:spPr/></p:pic>";
    }

    inline std::string rels(const std::vector<std::pair<std::string, std::string>> &targets) {
        std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                          "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
        for (const auto &t : targets) {
            xml += "<Relationship Id=\"" + t.first + "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\" Target=\"" + t.second + "\"/>";
        }
        return xml + "</Relationships>";
    }
}

// Bytes large enough to pass the default minimum image size
inline std::string fake_image(char fill, size_t size = 12000) { return std::string(size, fill); }

class CountingDescriber : public docchunk::retrieval::ImageDescriber {
public:
    explicit CountingDescriber(std::string reply = "A bar chart of quarterly revenue.") : reply(std::move(reply)) {}
    std::string describe(const std::string &, const std::string &mime) override {
        ++calls;
        lastMime = mime;
        if (throwOnCall) throw std::runtime_error("caption service unavailable");
        return reply;
    }
    std::string reply;
    std::string lastMime;
    bool throwOnCall = false;
    int calls = 0;
};

class MemorySink : public docchunk::retrieval::ImageSink {
public:
    std::string store(const std::string &documentId, int position, const std::string &extension, const std::string &bytes) override {
        if (failWrites) throw std::runtime_error("disk quota exceeded");
        stored.push_back({position, bytes.size()});
        return documentId + "/" + std::to_string(position) + "." + extension;
    }
    std::vector<std::pair<int, size_t>> stored;
    bool failWrites = false;
};
