#include "cusplit/Segmenter.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace cusplit {

Segmenter::Segmenter() : Segmenter(SegmenterConfig()) {}

Segmenter::Segmenter(const SegmenterConfig &config) : m_config(config) {
  if (m_config.headerZoneFraction <= 0.0 || m_config.headerZoneFraction > 1.0) {
    throw std::invalid_argument("headerZoneFraction must be in (0, 1], got " +
                                std::to_string(m_config.headerZoneFraction));
  }

  for (const auto &pattern : m_config.markerPatterns) {
    try {
      m_markers.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &e) {
      throw std::invalid_argument("Invalid marker pattern '" + pattern +
                                  "': " + e.what());
    }
  }
}

const SegmenterConfig &Segmenter::getConfig() const { return m_config; }

bool Segmenter::isStartPage(const std::string &text, int &year) const {
  year = 0;
  if (text.empty()) {
    return false;
  }

  double headerLimit =
      static_cast<double>(text.size()) * m_config.headerZoneFraction;

  for (const auto &marker : m_markers) {
    std::smatch match;
    if (!std::regex_search(text, match, marker)) {
      continue;
    }

    // Only the first occurrence is considered; a marker quoted further down
    // the page does not make it a first page.
    if (static_cast<double>(match.position(0)) >= headerLimit) {
      continue;
    }

    if (match.size() > 1 && match[1].matched && match[1].length() == 4) {
      year = std::stoi(match[1].str());
    }
    return true;
  }

  return false;
}

SegmentationResult Segmenter::segment(const std::vector<PageText> &pages) const {
  SegmentationResult result;
  result.pageCount = static_cast<int>(pages.size());

  auto startTime = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < pages.size(); i++) {
    if (pages[i].index != static_cast<int>(i)) {
      result.errorMessage = "Page indices are not sequential: position " +
                            std::to_string(i) + " holds page " +
                            std::to_string(pages[i].index);
      return result;
    }
  }

  CertificateRecord *current = nullptr;

  for (const auto &page : pages) {
    int year = 0;
    if (isStartPage(page.text, year)) {
      CertificateRecord shell;
      shell.startPage = page.index;
      shell.endPage = page.index;
      shell.markerYear = year;
      shell.rawText = page.text + "\n";
      result.records.push_back(shell);
      current = &result.records.back();

      if (m_config.verbose) {
        std::cerr << "DEBUG: Start marker on page " << (page.index + 1)
                  << (year > 0 ? " (year " + std::to_string(year) + ")" : "")
                  << std::endl;
      }
      continue;
    }

    if (current == nullptr) {
      result.droppedPages++;
      continue;
    }

    current->endPage = page.index;
    current->rawText += page.text + "\n";
  }

  if (result.records.empty()) {
    std::string warning =
        "No certificate start marker found in " +
        std::to_string(result.pageCount) +
        " page(s); the document may not be in a supported format";
    std::cerr << "WARNING: " << warning << std::endl;
    result.warnings.push_back(warning);
  } else if (result.droppedPages > 0) {
    std::string warning = "Dropped " + std::to_string(result.droppedPages) +
                          " page(s) before the first certificate (pages 1-" +
                          std::to_string(result.droppedPages) + ")";
    std::cerr << "WARNING: " << warning << std::endl;
    result.warnings.push_back(warning);
  }

  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace cusplit
