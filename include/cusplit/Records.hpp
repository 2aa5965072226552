#ifndef CUSPLIT_RECORDS_HPP
#define CUSPLIT_RECORDS_HPP

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Plain text of one page of the input document
 */
struct PageText {
  int index = 0;    ///< 0-based page index
  std::string text; ///< Extracted text (may be empty)
};

/**
 * @brief Match strategies a record can still take part in, given the fields
 * that could be extracted from it
 */
enum class MatchStrategy {
  None,         ///< Neither fiscal code nor name: only Unmatched is possible
  ExactOnly,    ///< Fiscal code present, name missing
  FuzzyOnly,    ///< Name present, fiscal code missing
  ExactAndFuzzy ///< Both present
};

/**
 * @brief One certificate (CU) found in the multi-record document
 *
 * Created as a shell (page range and raw text only) by the Segmenter, then
 * completed by the FieldExtractor. Absent text fields are empty strings and an
 * absent tax year is 0.
 */
struct CertificateRecord {
  int startPage = 0;   ///< First page (0-based, inclusive)
  int endPage = 0;     ///< Last page (0-based, inclusive)
  std::string rawText; ///< Concatenated text of all pages in the range
  int markerYear = 0;  ///< Year captured by the start marker, 0 if none

  std::string surname;    ///< Normalized surname (uppercase, no diacritics)
  std::string givenName;  ///< Normalized given name
  std::string fiscalCode; ///< 16-character fiscal code, uppercase
  int taxYear = 0;        ///< Tax year, 0 if absent

  bool nameFromLabel = false;  ///< Name came from a labeled field
  bool yearFromAnchor = false; ///< Year came from a marker or year label

  bool hasFiscalCode() const { return !fiscalCode.empty(); }
  bool hasName() const { return !surname.empty() || !givenName.empty(); }
  bool hasTaxYear() const { return taxYear > 0; }
  int pageCount() const { return endPage - startPage + 1; }

  /// Stable identifier of the page range, e.g. "p3-5" (0-based pages)
  std::string id() const;

  /// Surname and given name joined by a single space
  std::string fullName() const;

  MatchStrategy eligibleStrategies() const;
};

/**
 * @brief A known subject from the externally supplied roster
 */
struct RosterEntry {
  std::string surname;
  std::string givenName;
  std::string fiscalCode;
  std::string email;

  std::string fullName() const;
};

const char *toString(MatchStrategy strategy);

} // namespace cusplit

#endif // CUSPLIT_RECORDS_HPP
