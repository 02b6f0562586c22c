#include "test_common.h"
#include "docchunk/retrieval/text_sanitizer.hpp"

using docchunk::retrieval::cleanText;

int main() {
    quiet_logs();

    if (cleanText("a\r\nb\rc") != "a\nb\nc") return fail(64, "line endings not normalized");
    if (cleanText("col1\tcol2") != "col1\tcol2") return fail(65, "tab must survive");
    if (cleanText(std::string("a\x00" "b\x07" "c\x1f", 6)) != "abc") return fail(66, "C0 controls not stripped");
    if (cleanText("a\x7f" "b") != "ab") return fail(67, "DEL not stripped");

    // U+0085 (C1) and U+FFFE / U+FFFF / U+FDD0 noncharacters
    if (cleanText("x\xC2\x85y") != "xy") return fail(68, "C1 control not stripped");
    if (cleanText("x\xEF\xBF\xBEy\xEF\xBF\xBFz") != "xyz") return fail(69, "FFFE/FFFF not stripped");
    if (cleanText("x\xEF\xB7\x90y") != "xy") return fail(70, "FDD0 not stripped");

    // Multi-byte text passes through untouched
    const std::string utf8 = "Umsatz \xE2\x82\xAC 5 \xF0\x9F\x93\x88";
    if (cleanText(utf8) != utf8) return fail(71, "valid UTF-8 altered: " + cleanText(utf8));

    // Stray continuation and truncated lead bytes are dropped
    if (cleanText("a\x80" "b\xE2\x82") != "ab") return fail(72, "malformed UTF-8 kept");

    if (!cleanText("").empty()) return fail(73, "empty input should stay empty");

    std::cout << "[TEST] OK text sanitizer\n";
    return 0;
}
