#ifndef DOCCHUNK_TEXT_SANITIZER_HPP
#define DOCCHUNK_TEXT_SANITIZER_HPP

#include <string>

namespace docchunk
{
namespace retrieval
{

/**
 * @brief Normalizes line endings and strips code points the search index rejects
 *
 * `\r\n` and bare `\r` become `\n`. Removed: C0 controls other than tab and
 * newline, DEL, C1 controls, U+FDD0..U+FDEF, U+FFFE, U+FFFF, and any byte
 * that is not part of a well-formed UTF-8 sequence. Never throws.
 */
std::string cleanText(const std::string& raw);

} // namespace retrieval
} // namespace docchunk

#endif // DOCCHUNK_TEXT_SANITIZER_HPP
