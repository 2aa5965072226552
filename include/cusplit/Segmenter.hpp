#ifndef CUSPLIT_SEGMENTER_HPP
#define CUSPLIT_SEGMENTER_HPP

#include "cusplit/Records.hpp"

#include <regex>
#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Configuration options for boundary detection
 */
struct SegmenterConfig {
  /// Start marker patterns (ECMAScript regex, matched case-insensitively),
  /// tried in order. An optional first capture group holding 4 digits is
  /// recorded as the record's marker year.
  std::vector<std::string> markerPatterns = {
      "CERTIFICAZIONE\\s+UNICA\\s+(\\d{4})"};

  /// Fraction of the page text (from the top) in which a marker counts.
  /// 1.0 accepts a marker anywhere on the page.
  double headerZoneFraction = 1.0;

  bool verbose = false; ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of segmenting a document into certificate shells
 */
struct SegmentationResult {
  bool success = false;                   ///< Whether segmentation ran
  std::string errorMessage;               ///< Error message if failed
  std::vector<CertificateRecord> records; ///< Shells in document order
  std::vector<std::string> warnings;      ///< Non-fatal findings
  int pageCount = 0;                      ///< Pages in the input
  int droppedPages = 0;                   ///< Pages before the first marker
  double processingTimeMs = 0;            ///< Processing time in milliseconds
};

/**
 * @brief Partitions the ordered page texts of a document into contiguous page
 * ranges, one per certificate
 *
 * A page starts a new record iff a start marker is found on it; the record
 * runs up to the page before the next marker or to the end of the document.
 * Pages before the first marker belong to no record and are dropped with a
 * warning. A marker sharing a page with the tail of the previous record still
 * starts a new record on that page.
 *
 * Example usage:
 * @code
 * cusplit::Segmenter segmenter;
 * auto result = segmenter.segment(pages);
 * for (const auto &shell : result.records) {
 *   std::cout << shell.startPage << "-" << shell.endPage << "\n";
 * }
 * @endcode
 */
class Segmenter {
public:
  Segmenter();

  /**
   * @brief Constructor with custom configuration
   * @throws std::invalid_argument if a marker pattern does not compile or the
   * header zone fraction is outside (0, 1]
   */
  explicit Segmenter(const SegmenterConfig &config);

  /**
   * @brief Segment a document
   * @param pages Page texts; indices must be 0, 1, 2, ... in order
   * @return SegmentationResult with record shells (page ranges, raw text and
   * marker year; subject fields left empty)
   */
  SegmentationResult segment(const std::vector<PageText> &pages) const;

  /**
   * @brief Test one page for a start marker
   * @param text Page text
   * @param year Receives the captured marker year, 0 if none
   * @return true if the page starts a new record
   */
  bool isStartPage(const std::string &text, int &year) const;

  const SegmenterConfig &getConfig() const;

private:
  SegmenterConfig m_config;
  std::vector<std::regex> m_markers;
};

} // namespace cusplit

#endif // CUSPLIT_SEGMENTER_HPP
