#include "cusplit/Pipeline.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace cusplit {

bool readPages(PageTextSource &source, std::vector<PageText> &pages,
               std::string &errorMessage) {
  pages.clear();

  int count = 0;
  try {
    count = source.pageCount();
  } catch (const std::exception &e) {
    errorMessage = std::string("Failed to read page count: ") + e.what();
    return false;
  }

  pages.reserve(static_cast<size_t>(count > 0 ? count : 0));
  for (int index = 0; index < count; index++) {
    try {
      pages.push_back({index, source.pageText(index)});
    } catch (const std::exception &e) {
      errorMessage = "Failed to read page " + std::to_string(index + 1) +
                     ": " + e.what();
      pages.clear();
      return false;
    }
  }

  return true;
}

ExtractionResult runExtraction(PageTextSource &source,
                               const SegmenterConfig &segmenterConfig,
                               const ExtractorConfig &extractorConfig) {
  ExtractionResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::vector<PageText> pages;
    if (!readPages(source, pages, result.errorMessage)) {
      std::cerr << "ERROR: " << result.errorMessage << std::endl;
      return result;
    }
    result.pageCount = static_cast<int>(pages.size());

    Segmenter segmenter(segmenterConfig);
    SegmentationResult segments = segmenter.segment(pages);
    result.warnings = segments.warnings;
    result.droppedPages = segments.droppedPages;
    if (!segments.success) {
      result.errorMessage = segments.errorMessage;
      std::cerr << "ERROR: " << result.errorMessage << std::endl;
      return result;
    }

    FieldExtractor extractor(extractorConfig);
    result.records.reserve(segments.records.size());
    for (const auto &shell : segments.records) {
      result.records.push_back(extractor.extract(shell, &result.warnings));
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Extraction failed: ") + e.what();
    std::cerr << "ERROR: " << result.errorMessage << std::endl;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace cusplit
