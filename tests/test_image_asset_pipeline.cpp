#include "test_common.h"
#include "docchunk/retrieval/image_asset_pipeline.hpp"
#include <csignal>
#include <filesystem>
#include <memory>
#include <sys/resource.h>

using namespace docchunk::retrieval;
namespace fs = std::filesystem;

int main() {
    quiet_logs();

    auto describer = std::make_shared<CountingDescriber>();
    auto sink = std::make_shared<MemorySink>();
    ImageAssetPipeline::Config config;
    config.maxFileSize = 20000;
    ImageAssetPipeline pipeline(config, describer, sink);
    DescriptionCache cache;

    // Gate order: small, large, unsupported
    auto r = pipeline.process(std::string(100, 'x'), "ppt/media/logo.png", cache, "deck", 0, true);
    if (r.success || r.skipReason != ImageSkipReason::TooSmall) return fail(64, "tiny image not skipped");
    r = pipeline.process(std::string(30000, 'x'), "ppt/media/huge.png", cache, "deck", 0, true);
    if (r.success || r.skipReason != ImageSkipReason::TooLarge) return fail(65, "large image not skipped");
    if (!has_log(LogLevel::PIPELINE_WARNING, "Skipping large image")) return fail(66, "large image not logged as warning");
    r = pipeline.process(fake_image('x'), "ppt/media/image1.emf", cache, "deck", 0, true);
    if (r.success || r.skipReason != ImageSkipReason::UnsupportedType) return fail(67, "emf accepted");
    r = pipeline.process(fake_image('x'), "ppt/media/image1", cache, "deck", 0, true);
    if (r.skipReason != ImageSkipReason::UnsupportedType) return fail(68, "extensionless asset accepted");
    if (describer->calls != 0 || !sink->stored.empty()) return fail(69, "gated images reached collaborators");

    // Accepted image is described and stored at its position
    r = pipeline.process(fake_image('a'), "ppt/media/image1.PNG", cache, "deck", 3, true);
    if (!r.success || r.description != describer->reply) return fail(70, "image not described");
    if (describer->lastMime != "image/png") return fail(71, "mime type: " + describer->lastMime);
    if (sink->stored.size() != 1 || sink->stored[0].first != 3) return fail(72, "image not stored at position 3");
    if (r.storedPath != "deck/3.png") return fail(73, "stored path: " + r.storedPath);

    // Identical bytes reuse the cached description
    r = pipeline.process(fake_image('a'), "ppt/media/image9.png", cache, "deck", 4, true);
    if (!r.success || !r.reusedDescription || r.description != describer->reply) return fail(74, "duplicate not reused");
    if (describer->calls != 1) return fail(75, "describer called for a duplicate");
    if (sink->stored.size() != 2) return fail(76, "duplicate must still be stored");

    // Sentinels skip the image and are cached as well
    describer->reply = kNotWorthDescribingSentinel;
    r = pipeline.process(fake_image('b'), "ppt/media/divider.png", cache, "deck", 5, true);
    if (r.success || r.skipReason != ImageSkipReason::NoDescription) return fail(77, "sentinel image kept");
    r = pipeline.process(fake_image('b'), "ppt/media/divider2.png", cache, "deck", 6, true);
    if (r.success || describer->calls != 2) return fail(78, "cached sentinel should not call the describer again");
    describer->reply = "";
    r = pipeline.process(fake_image('c'), "ppt/media/blank.jpeg", cache, "deck", 7, true);
    if (r.skipReason != ImageSkipReason::NoDescription) return fail(79, "empty description kept");

    // Describer exceptions skip the image and are not cached
    describer->throwOnCall = true;
    r = pipeline.process(fake_image('d'), "ppt/media/image4.gif", cache, "deck", 8, true);
    if (r.success || r.skipReason != ImageSkipReason::DescriberFailed) return fail(80, "describer failure not reported");
    describer->throwOnCall = false;
    describer->reply = "A gif.";
    r = pipeline.process(fake_image('d'), "ppt/media/image4.gif", cache, "deck", 8, true);
    if (!r.success || r.description != "A gif.") return fail(81, "failed describe must not be cached");

    // The .jpg spelling is sent to the describer as the registered image/jpeg type
    r = pipeline.process(fake_image('j'), "ppt/media/photo.jpg", cache, "deck", 11, true);
    if (!r.success || describer->lastMime != "image/jpeg") return fail(94, "jpg mime type: " + describer->lastMime);
    if (r.storedPath != "deck/11.jpg") return fail(95, "jpg stored path: " + r.storedPath);
    if (describeMimeType("gif") != "image/gif" || describeMimeType("jpeg") != "image/jpeg") return fail(96, "describeMimeType");

    // Describing disabled: generic description, no describer call
    const int callsBefore = describer->calls;
    r = pipeline.process(fake_image('e'), "ppt/media/image5.webp", cache, "deck", 9, false);
    if (!r.success || r.description != config.genericDescription) return fail(82, "generic description not used");
    if (describer->calls != callsBefore) return fail(83, "describer called while disabled");

    // Storage failure
    sink->failWrites = true;
    r = pipeline.process(fake_image('f'), "ppt/media/image6.png", cache, "deck", 10, false);
    if (r.success || r.skipReason != ImageSkipReason::StorageFailed) return fail(84, "storage failure not reported");
    if (!has_log(LogLevel::PIPELINE_ERROR, "Failed to save image")) return fail(85, "storage failure not logged as error");

    // A pipeline without a sink is a programming error
    try {
        ImageAssetPipeline broken(config, describer, nullptr);
        return fail(86, "null sink accepted");
    } catch (const std::invalid_argument &) {}

    // Hashing and sentinels
    if (ImageAssetPipeline::contentHash("abc") != "900150983cd24fb0d6963f7d28e17f72") return fail(87, "md5 mismatch");
    if (!ImageAssetPipeline::isSentinel(kNoDescriptionSentinel) || ImageAssetPipeline::isSentinel("A cat.")) return fail(88, "isSentinel");

    // Filesystem sink writes <root>/<doc>/<pos>.<ext> and cleans up on failure
    const fs::path root = fs::absolute("image_sink_test_root");
    fs::remove_all(root);
    FilesystemImageSink fsSink(root.string());
    const std::string path = fsSink.store("doc-1", 5, "png", fake_image('g', 10));
    if (fs::path(path) != root / "doc-1" / "5.png" || fs::file_size(path) != 10) return fail(89, "sink path: " + path);

    try {
        fsSink.store("../escape", 1, "png", "x");
        return fail(90, "unsafe document id accepted");
    } catch (const std::invalid_argument &) {}

    try {
        fsSink.store("doc-2", 1, std::string(300, 'x'), "x"); // file name too long
        return fail(91, "over-long file name accepted");
    } catch (const std::exception &) {}
    if (fs::exists(root / "doc-2")) return fail(92, "failed write left its directory behind");
    if (!fs::exists(root / "doc-1" / "5.png")) return fail(93, "earlier image removed");

    // A short write into an existing document directory removes the partial file
    std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit previous;
    if (getrlimit(RLIMIT_FSIZE, &previous) != 0) return fail(97, "getrlimit failed");
    struct rlimit capped = previous;
    capped.rlim_cur = 50000;
    if (setrlimit(RLIMIT_FSIZE, &capped) != 0) return fail(98, "setrlimit failed");
    bool threw = false;
    try {
        fsSink.store("doc-1", 6, "png", fake_image('h', 200000));
    } catch (const std::exception &) {
        threw = true;
    }
    setrlimit(RLIMIT_FSIZE, &previous);
    if (!threw) return fail(99, "short write not reported");
    if (fs::exists(root / "doc-1" / "6.png")) return fail(100, "partial image left behind");
    if (!fs::exists(root / "doc-1" / "5.png")) return fail(101, "earlier image removed by failed write");

    fs::remove_all(root);
    std::cout << "[TEST] OK image asset pipeline\n";
    return 0;
}
