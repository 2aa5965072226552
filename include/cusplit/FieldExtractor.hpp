#ifndef CUSPLIT_FIELD_EXTRACTOR_HPP
#define CUSPLIT_FIELD_EXTRACTOR_HPP

#include "cusplit/Records.hpp"

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Label variants used by one certificate layout (vendor or locale)
 *
 * Labels are plain phrases, matched case-insensitively on word boundaries with
 * any amount of whitespace between their words.
 */
struct LabelProfile {
  std::string name;                        ///< Profile name for diagnostics
  std::vector<std::string> surnameLabels;  ///< Tried in order
  std::vector<std::string> givenNameLabels; ///< Tried in order
  std::vector<std::string> yearLabels;     ///< Anchors for the tax year
  std::vector<std::string> stopLabels;     ///< Other labels that end a value
};

/// Layout of the Italian "Certificazione Unica" produced by payroll software
LabelProfile italianCuProfile();

/**
 * @brief Configuration options for field extraction
 */
struct ExtractorConfig {
  std::vector<LabelProfile> profiles = {italianCuProfile()};

  /// Headings that open the subject's section; searches start after the
  /// first one found.
  std::vector<std::string> subjectSectionAnchors = {
      "DATI RELATIVI AL DIPENDENTE", "DATI ANAGRAFICI DEL PERCIPIENTE",
      "DATI RELATIVI AL PERCIPIENTE", "DATI ANAGRAFICI"};

  bool requireCheckCharacter = false; ///< Reject codes with a wrong check letter
  int referenceYear = 0; ///< Latest plausible tax year minus one; 0 = this year
  int yearWindow = 40;   ///< Bytes after a year label searched for the year
  bool verbose = false;  ///< Print DEBUG lines to stderr
};

/**
 * @brief Populates the subject fields of a certificate shell from its text
 *
 * Each field is extracted independently; a field that cannot be found stays
 * absent and never fails the record.
 */
class FieldExtractor {
public:
  FieldExtractor();
  explicit FieldExtractor(const ExtractorConfig &config);

  /**
   * @brief Extract surname, given name, fiscal code and tax year
   * @param shell Record produced by the Segmenter
   * @param warnings Optional sink for per-record findings
   * @return Copy of shell with the subject fields filled in
   */
  CertificateRecord extract(const CertificateRecord &shell,
                            std::vector<std::string> *warnings = nullptr) const;

  /**
   * @brief First fiscal code of the subject
   *
   * Searches after the subject section anchor first, then the whole text.
   * @return Uppercase code, or an empty string
   */
  std::string extractFiscalCode(const std::string &text) const;

  /**
   * @brief Surname and given name from labeled fields
   * @return true if at least one of the two was found
   */
  bool extractLabeledName(const std::string &text, std::string &surname,
                          std::string &givenName) const;

  /**
   * @brief Name from the letters-only line closest above the fiscal code
   * @return true if a line of at least two words was found
   */
  bool extractNameNearCode(const std::string &text,
                           const std::string &fiscalCode, std::string &surname,
                           std::string &givenName) const;

  /**
   * @brief Tax year near a year label, else the latest plausible year
   * @param fromAnchor Set when the year came from a label
   * @return Year, or 0 if none found
   */
  int extractTaxYear(const std::string &text, bool &fromAnchor) const;

  const ExtractorConfig &getConfig() const;

private:
  /// Offset just past the first subject section anchor, 0 if none
  size_t subjectSectionStart(const std::string &text) const;

  int latestYear() const;

  ExtractorConfig m_config;
};

} // namespace cusplit

#endif // CUSPLIT_FIELD_EXTRACTOR_HPP
