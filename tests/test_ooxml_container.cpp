#include "test_common.h"
#include "docchunk/retrieval/ooxml_container.hpp"

using namespace docchunk::retrieval;

static int expect_failure(const std::string &bytes, ContainerFailure expected, int code) {
    try {
        OOXMLContainer::open(bytes);
    } catch (const ContainerError &ex) {
        if (ex.failure() != expected) return fail(code, std::string("wrong failure kind: ") + ex.what());
        return 0;
    }
    return fail(code, "open() did not throw");
}

int main() {
    quiet_logs();

    const std::string slide = slidexml::doc(slidexml::shape("title", slidexml::para("Hello")));
    const std::string package = StoredZip()
        .add("[Content_Types].xml", "<Types/>")
        .add("ppt/slides/slide10.xml", slide)
        .add("ppt/slides/slide2.xml", slide)
        .add("ppt/slides/slide1.xml", slide)
        .add("ppt/slides/_rels/slide1.xml.rels", slidexml::rels({}))
        .add("ppt/media/broken.xml", "<a><b></a>")
        .add("ppt/media/image1.png", std::string(100000, 'p'))
        .build();

    auto container = OOXMLContainer::open(package);
    if (container->entries().size() != 7) return fail(64, "expected 7 entries");

    auto slides = container->listParts("ppt/slides/slide*.xml");
    if (slides.size() != 3) return fail(65, "expected 3 slide parts, got " + std::to_string(slides.size()));
    if (slides[0] != "ppt/slides/slide1.xml" || slides[1] != "ppt/slides/slide2.xml" || slides[2] != "ppt/slides/slide10.xml")
        return fail(66, "slides not in numeric order");

    auto content = container->readPart("ppt/slides/slide2.xml");
    if (!content || *content != slide) return fail(67, "slide bytes differ");
    if (container->readPart("ppt/slides/slide3.xml")) return fail(68, "missing part returned bytes");
    if (!container->hasPart("[Content_Types].xml")) return fail(69, "hasPart missed an entry");

    // Capped reads stop inflating at the limit
    auto capped = container->readPart("ppt/media/image1.png", 4097);
    if (!capped || capped->size() != 4097) return fail(82, "capped read size: " + std::to_string(capped ? capped->size() : 0));
    auto exact = container->readPart("ppt/media/image1.png", 100000);
    if (!exact || exact->size() != 100000) return fail(83, "read at the exact size was cut short");
    auto underCap = container->readPart("ppt/slides/slide2.xml", 1 << 20);
    if (!underCap || *underCap != slide) return fail(84, "small part changed by a large cap");

    if (container->readXml("ppt/notesSlides/notesSlide1.xml") != nullptr) return fail(70, "missing XML part should be null");
    auto doc = container->readXml("ppt/slides/slide1.xml");
    if (!doc || !doc->document_element()) return fail(71, "slide XML not parsed");
    try {
        container->readXml("ppt/media/broken.xml");
        return fail(72, "malformed XML accepted");
    } catch (const std::runtime_error &) {}

    // Container-level failures
    const std::string cfb("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1" "encrypted payload", 25);
    if (int rc = expect_failure(cfb, ContainerFailure::PasswordProtected, 73)) return rc;
    const std::string encryptedZip = StoredZip().add("ppt/slides/slide1.xml", slide).encrypted().build();
    if (int rc = expect_failure(encryptedZip, ContainerFailure::PasswordProtected, 74)) return rc;
    if (int rc = expect_failure("this is not a zip archive", ContainerFailure::CorruptArchive, 75)) return rc;
    if (int rc = expect_failure("", ContainerFailure::CorruptArchive, 76)) return rc;

    // Helpers
    if (OOXMLContainer::partIndex("ppt/slides/slide12.xml") != 12) return fail(77, "partIndex");
    if (OOXMLContainer::partIndex("ppt/presentation.xml") != 0) return fail(78, "partIndex without digits");
    if (!OOXMLContainer::globMatch("ppt/slides/slide*.xml", "ppt/slides/slide7.xml")) return fail(79, "glob miss");
    if (OOXMLContainer::globMatch("ppt/slides/*.xml", "ppt/slides/_rels/slide1.xml")) return fail(80, "* crossed a directory");
    if (!OOXMLContainer::globMatch("ppt/media/image?.png", "ppt/media/image3.png")) return fail(81, "? did not match");

    std::cout << "[TEST] OK ooxml container\n";
    return 0;
}
