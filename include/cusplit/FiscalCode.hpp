#ifndef CUSPLIT_FISCAL_CODE_HPP
#define CUSPLIT_FISCAL_CODE_HPP

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Validation and lookup of 16-character personal fiscal codes
 *
 * Layout: 6 letters (surname and name consonants), 2 year digits, a month
 * letter, 2 day digits (women add 40), a letter and 3 digits for the place of
 * birth and a check letter. Any digit may be replaced by its omocodia letter
 * (L M N P Q R S T U V for 0-9) when two people would otherwise share a code.
 */
namespace fiscal_code {

constexpr size_t kLength = 16;

/**
 * @brief Check the positional alphabet, the month letter and the day range
 *
 * The check letter is not verified here; see hasValidCheckCharacter().
 * Lowercase input is rejected, callers uppercase first.
 */
bool isStructurallyValid(const std::string &code);

/**
 * @brief Compute the check letter of the first 15 characters
 * @return 'A'..'Z', or '\0' if the input is not 15 alphanumerics
 */
char computeCheckCharacter(const std::string &first15);

/// True when the 16th character equals computeCheckCharacter()
bool hasValidCheckCharacter(const std::string &code);

/// A code found in a text and its byte offset
struct Occurrence {
  std::string code;
  size_t offset = 0;
};

/**
 * @brief Find every valid code in a text, in order of occurrence
 *
 * Candidates are maximal alphanumeric tokens of exactly 16 characters,
 * uppercased before validation.
 *
 * @param text Text to scan
 * @param requireCheckCharacter Also reject codes whose check letter is wrong
 * @return Codes with their byte offsets in text
 */
std::vector<Occurrence> findAll(const std::string &text,
                                bool requireCheckCharacter = false);

} // namespace fiscal_code

} // namespace cusplit

#endif // CUSPLIT_FISCAL_CODE_HPP
