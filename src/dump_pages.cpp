#include "cusplit/PdfPageSource.hpp"
#include "cusplit/Segmenter.hpp"

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <pdf_file> [--ocr] [max_chars]"
              << std::endl;
    return 1;
  }

  std::string pdfPath = argv[1];
  cusplit::PdfSourceConfig config;
  config.verbose = true;
  size_t maxChars = 400;

  try {
    for (int i = 2; i < argc; i++) {
      std::string arg = argv[i];
      if (arg == "--ocr") {
        config.ocrFallback = true;
      } else {
        maxChars = static_cast<size_t>(std::stoul(arg));
      }
    }

    std::cout << "Loading PDF: " << pdfPath << std::endl;

    cusplit::PdfPageSource source(config);
    cusplit::PdfOpenResult opened = source.open(pdfPath);

    if (!opened.success) {
      std::cerr << "Failed to load PDF file: " << opened.errorMessage
                << std::endl;
      return 1;
    }

    std::cout << "Number of pages: " << opened.pageCount << std::endl;

    cusplit::Segmenter segmenter;
    int markers = 0;

    for (int index = 0; index < source.pageCount(); index++) {
      std::string text = source.pageText(index);
      int year = 0;
      bool start = segmenter.isStartPage(text, year);
      if (start) {
        markers++;
      }

      std::cout << "\n--- Page " << (index + 1) << " (" << text.size()
                << " bytes)";
      if (start) {
        std::cout << " START MARKER";
        if (year > 0) {
          std::cout << " year " << year;
        }
      }
      std::cout << " ---" << std::endl;

      if (text.size() > maxChars) {
        std::cout << text.substr(0, maxChars) << "\n[...]" << std::endl;
      } else {
        std::cout << text << std::endl;
      }
    }

    std::cout << "\nStart markers: " << markers << std::endl;
    std::cout << "OCR pages: " << source.ocrPageCount() << std::endl;
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
}
