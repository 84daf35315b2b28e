#ifndef OCRBATCH_TEXT_CLEANER_HPP
#define OCRBATCH_TEXT_CLEANER_HPP

#include <string>

namespace ocrbatch {

/**
 * @brief Normalize raw OCR output for readability
 *
 * Removes U+FFFD replacement characters, trims every line, collapses runs of
 * whitespace inside a line, drops empty lines, limits consecutive newlines
 * to two and trims the result. Applying it twice gives the same text.
 *
 * @param rawText UTF-8 text as returned by the OCR engine
 * @return Cleaned text, lines joined with '\n'
 */
std::string cleanText(const std::string &rawText);

} // namespace ocrbatch

#endif // OCRBATCH_TEXT_CLEANER_HPP
