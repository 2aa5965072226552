#ifndef CUSPLIT_TEXT_NORMALIZER_HPP
#define CUSPLIT_TEXT_NORMALIZER_HPP

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Normalize a personal name for storage and comparison
 *
 * Decodes UTF-8 (bytes that are not valid UTF-8 are read as Latin-1), folds
 * accented Latin letters to their base letter, uppercases, turns every
 * character that is not a letter or digit into a separator and collapses
 * separators into single spaces.
 *
 * @param text Raw text, e.g. "  d'Alessandro  Niccolò "
 * @return Normalized text, e.g. "D ALESSANDRO NICCOLO"
 */
std::string normalizeName(const std::string &text);

/// Uppercase ASCII letters, leave every other byte untouched
std::string toUpperAscii(const std::string &text);

/// Trim and collapse runs of ASCII whitespace into one space
std::string collapseWhitespace(const std::string &text);

/// Strip leading and trailing ASCII whitespace
std::string trim(const std::string &text);

/// "ROSSI DE LUCA" -> "Rossi De Luca" (ASCII only)
std::string titleCase(const std::string &text);

/// Split on ASCII whitespace, dropping empty tokens
std::vector<std::string> splitWords(const std::string &text);

/// Split on '\n', dropping '\r'; empty lines are kept
std::vector<std::string> splitLines(const std::string &text);

} // namespace cusplit

#endif // CUSPLIT_TEXT_NORMALIZER_HPP
