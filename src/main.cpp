#include "cusplit/MessageComposer.hpp"
#include "cusplit/PdfPageSource.hpp"
#include "cusplit/Pipeline.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  --ocr                   OCR pages without a text layer\n"
      << "  -l, --lang <lang>       Set OCR language (default: ita)\n"
      << "  --tessdata <dir>        Tesseract data directory\n"
      << "                          (default: $TESSDATA_PREFIX)\n"
      << "  --dpi <n>               OCR rendering resolution (default: 300)\n"
      << "  --header-zone <f>       Fraction of the page searched for the\n"
      << "                          start marker, 0 < f <= 1 (default: 1)\n"
      << "  --strict-checksum       Reject fiscal codes with a wrong check "
         "letter\n"
      << "  -v, --verbose           Print debug output\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " CU_2025.pdf\n"
      << "  " << programName << " scanned.pdf --ocr --lang ita+eng\n";
}

namespace {

bool parseNumber(const std::string &option, const char *value, double &out) {
  try {
    size_t used = 0;
    out = std::stod(value, &used);
    if (used == std::string(value).size()) {
      return true;
    }
  } catch (const std::exception &) {
    // reported below
  }
  std::cerr << "Error: " << option << " expects a number, got '" << value
            << "'\n";
  return false;
}

std::string displayOrDash(const std::string &value) {
  return value.empty() ? "-" : value;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  cusplit::PdfSourceConfig sourceConfig;
  cusplit::SegmenterConfig segmenterConfig;
  cusplit::ExtractorConfig extractorConfig;
  bool verbose = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--ocr") {
      sourceConfig.ocrFallback = true;
    } else if (arg == "-l" || arg == "--lang") {
      if (i + 1 < argc) {
        sourceConfig.language = argv[++i];
      } else {
        std::cerr << "Error: --lang requires an argument\n";
        return 1;
      }
    } else if (arg == "--tessdata") {
      if (i + 1 < argc) {
        sourceConfig.tessDataPath = argv[++i];
      } else {
        std::cerr << "Error: --tessdata requires an argument\n";
        return 1;
      }
    } else if (arg == "--dpi") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --dpi requires an argument\n";
        return 1;
      }
      if (!parseNumber(arg, argv[++i], sourceConfig.dpi) ||
          sourceConfig.dpi <= 0) {
        std::cerr << "Error: --dpi must be positive\n";
        return 1;
      }
    } else if (arg == "--header-zone") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --header-zone requires an argument\n";
        return 1;
      }
      if (!parseNumber(arg, argv[++i], segmenterConfig.headerZoneFraction)) {
        return 1;
      }
    } else if (arg == "--strict-checksum") {
      extractorConfig.requireCheckCharacter = true;
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  sourceConfig.verbose = verbose;
  segmenterConfig.verbose = verbose;
  extractorConfig.verbose = verbose;

  std::cout << "=== CU Splitter ===\n"
            << "Input: " << pdfPath << "\n"
            << "OCR fallback: " << (sourceConfig.ocrFallback ? "on" : "off");
  if (sourceConfig.ocrFallback) {
    std::cout << " (Tesseract "
              << cusplit::PdfPageSource::getTesseractVersion()
              << ", OpenCV " << CV_VERSION << ", language "
              << sourceConfig.language << ")";
  }
  std::cout << "\n===================\n\n";

  cusplit::PdfPageSource source(sourceConfig);
  cusplit::PdfOpenResult opened = source.open(pdfPath);
  if (!opened.success) {
    std::cerr << "Error: " << opened.errorMessage << "\n";
    return 1;
  }

  cusplit::ExtractionResult result =
      cusplit::runExtraction(source, segmenterConfig, extractorConfig);

  if (!result.success) {
    std::cerr << "Extraction failed: " << result.errorMessage << "\n";
    return 1;
  }

  std::cout << "[Certificates]\n";
  std::cout << std::setw(5) << "No." << std::setw(10) << "Pages"
            << std::setw(20) << "Fiscal code" << std::setw(8) << "Year"
            << "  " << std::left << std::setw(32) << "Name"
            << std::setw(16) << "Strategy" << "File" << std::right << "\n";
  std::cout << std::string(110, '-') << "\n";

  for (size_t i = 0; i < result.records.size(); ++i) {
    const auto &record = result.records[i];
    std::ostringstream pages;
    pages << (record.startPage + 1) << "-" << (record.endPage + 1);

    std::cout << std::setw(5) << (i + 1) << std::setw(10) << pages.str()
              << std::setw(20) << displayOrDash(record.fiscalCode)
              << std::setw(8)
              << (record.hasTaxYear() ? std::to_string(record.taxYear) : "-")
              << "  " << std::left << std::setw(32)
              << displayOrDash(record.fullName()) << std::setw(16)
              << cusplit::toString(record.eligibleStrategies())
              << cusplit::outputFilename(record) << std::right << "\n";
  }

  if (!result.warnings.empty()) {
    std::cout << "\n[Warnings]\n";
    for (const auto &warning : result.warnings) {
      std::cout << "  " << warning << "\n";
    }
  }

  std::cout << "\nPages: " << result.pageCount
            << " (dropped before first marker: " << result.droppedPages
            << ", OCR: " << source.ocrPageCount() << ")\n";
  std::cout << "Certificates found: " << result.records.size() << "\n";
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";

  return 0;
}
