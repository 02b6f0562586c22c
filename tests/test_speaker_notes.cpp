#include "test_common.h"
#include "docchunk/retrieval/speaker_notes.hpp"

using namespace docchunk::retrieval;

static std::string notes_part(const std::string &shapes) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
           "<p:notes xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
           "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\">"
           "<p:cSld><p:spTree>" + shapes + "</p:spTree></p:cSld></p:notes>";
}

int main() {
    quiet_logs();

    const std::string slide1Notes = notes_part(
        slidexml::shape("sldImg", "<a:p/>") +
        slidexml::shape("body", slidexml::para("Remember to mention churn.") + slidexml::para("Pause for questions.")) +
        slidexml::shape("sldNum", slidexml::para("1")) +
        slidexml::shape("", slidexml::para("Free text box"), false));

    const std::string package = StoredZip()
        .add("ppt/slides/slide1.xml", slidexml::doc(""))
        .add("ppt/notesSlides/notesSlide1.xml", slide1Notes)
        .add("ppt/notesSlides/notesSlide3.xml", "<p:notes><p:cSld>")
        .build();
    auto container = OOXMLContainer::open(package);

    const std::string notes = extractSpeakerNotes(*container, 1);
    if (notes != "Remember to mention churn.\nPause for questions.") return fail(64, "notes text: " + notes);

    if (!extractSpeakerNotes(*container, 2).empty()) return fail(65, "missing notes part should give empty text");

    if (!extractSpeakerNotes(*container, 3).empty()) return fail(66, "malformed notes should give empty text");
    if (!has_log(LogLevel::PIPELINE_DEBUG, "speaker notes for slide 3")) return fail(67, "malformed notes not logged");

    std::cout << "[TEST] OK speaker notes\n";
    return 0;
}
