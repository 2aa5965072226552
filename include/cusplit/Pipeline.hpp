#ifndef CUSPLIT_PIPELINE_HPP
#define CUSPLIT_PIPELINE_HPP

#include "cusplit/FieldExtractor.hpp"
#include "cusplit/PageSource.hpp"
#include "cusplit/Records.hpp"
#include "cusplit/Segmenter.hpp"

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Result of reading, segmenting and extracting one document
 */
struct ExtractionResult {
  bool success = false;                   ///< Whether the document was processed
  std::string errorMessage;               ///< Error message if failed
  std::vector<CertificateRecord> records; ///< Completed records, document order
  std::vector<std::string> warnings;      ///< Warnings of every stage
  int pageCount = 0;                      ///< Pages in the document
  int droppedPages = 0;                   ///< Pages before the first marker
  double processingTimeMs = 0;            ///< Processing time in milliseconds
};

/**
 * @brief Read every page of a source
 *
 * Any page that cannot be read fails the whole document.
 * @param errorMessage Receives the reason on failure
 * @return true on success
 */
bool readPages(PageTextSource &source, std::vector<PageText> &pages,
               std::string &errorMessage);

/**
 * @brief Page source -> Segmenter -> FieldExtractor
 */
ExtractionResult runExtraction(PageTextSource &source,
                               const SegmenterConfig &segmenterConfig = SegmenterConfig(),
                               const ExtractorConfig &extractorConfig = ExtractorConfig());

} // namespace cusplit

#endif // CUSPLIT_PIPELINE_HPP
