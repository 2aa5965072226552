#include "cusplit/PdfPageSource.hpp"

#include "cusplit/TextNormalizer.hpp"

#include <poppler-image.h>
#include <poppler-page-renderer.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace cusplit {

PdfPageSource::PdfPageSource() : PdfPageSource(PdfSourceConfig()) {}

PdfPageSource::PdfPageSource(const PdfSourceConfig &config)
    : m_tesseract(), m_config(config), m_ocrInitialized(false),
      m_ocrUnavailable(false), m_ocrPages(0) {}

PdfPageSource::~PdfPageSource() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

PdfOpenResult PdfPageSource::open(const std::string &pdfPath) {
  PdfOpenResult result;
  m_document.reset();
  m_ocrPages = 0;

  if (!std::filesystem::exists(pdfPath)) {
    result.errorMessage = "PDF file not found: " + pdfPath;
    return result;
  }

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    result.pageCount = doc->pages();
    m_document = std::move(doc);
    result.success = true;

    if (m_config.verbose) {
      std::cerr << "DEBUG: PDF has " << result.pageCount << " pages"
                << std::endl;
    }
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Failed to open PDF: ") + e.what();
  }

  return result;
}

bool PdfPageSource::isOpen() const { return m_document != nullptr; }

int PdfPageSource::pageCount() const {
  return m_document ? m_document->pages() : 0;
}

int PdfPageSource::ocrPageCount() const { return m_ocrPages; }

std::string PdfPageSource::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::string PdfPageSource::pageText(int index) {
  if (!m_document) {
    throw std::runtime_error("No PDF document open");
  }
  if (index < 0 || index >= m_document->pages()) {
    throw std::out_of_range("Page index " + std::to_string(index) +
                            " out of range");
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(index));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(index + 1));
  }

  std::string text = embeddedText(*page);
  if (!trim(text).empty() || !m_config.ocrFallback) {
    return text;
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << (index + 1)
              << " has no text layer, running OCR" << std::endl;
  }
  return recognizePage(*page, index);
}

std::string PdfPageSource::embeddedText(poppler::page &page) const {
  std::vector<poppler::text_box> textBoxes = page.text_list();

  std::string pageText;
  bool first = true;
  double previousY = 0.0;
  double previousHeight = 0.0;

  for (auto &textBox : textBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string word(textBytes.begin(), textBytes.end());
    if (word.empty()) {
      continue;
    }

    poppler::rectf bbox = textBox.bbox();

    // Same line while the boxes share (roughly) the same top edge
    if (!first) {
      double tolerance = std::max(2.0, std::max(bbox.height(), previousHeight) / 2);
      if (std::abs(bbox.y() - previousY) > tolerance) {
        if (!pageText.empty() && pageText.back() == ' ') {
          pageText.pop_back();
        }
        pageText += "\n";
      }
    }

    pageText += word;
    if (textBox.has_space_after()) {
      pageText += " ";
    }

    first = false;
    previousY = bbox.y();
    previousHeight = bbox.height();
  }

  return pageText;
}

bool PdfPageSource::initializeOcr() {
  if (m_ocrInitialized) {
    return true;
  }
  if (m_ocrUnavailable) {
    return false;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: TESSDATA_PREFIX, else Tesseract's compiled-in default
  else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
  }

  m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "WARNING: Failed to initialize Tesseract with language '"
              << m_config.language
              << "', scanned pages will be treated as blank" << std::endl;
    m_tesseract.reset();
    m_ocrUnavailable = true;
    return false;
  }

  m_tesseract->SetPageSegMode(tesseract::PSM_AUTO);
  m_ocrInitialized = true;
  return true;
}

std::string PdfPageSource::recognizePage(poppler::page &page, int index) {
  if (!initializeOcr()) {
    return "";
  }

  auto startTime = std::chrono::high_resolution_clock::now();
  std::string text;

  try {
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image popplerImage =
        renderer.render_page(&page, m_config.dpi, m_config.dpi);

    if (!popplerImage.is_valid()) {
      std::cerr << "WARNING: Failed to render page " << (index + 1)
                << " for OCR" << std::endl;
      return "";
    }

    cv::Mat image = toMat(popplerImage);
    if (image.empty()) {
      std::cerr << "WARNING: Unsupported image format on page " << (index + 1)
                << std::endl;
      return "";
    }

    cv::Mat processed = m_config.preprocessImage ? preprocessImage(image) : image;
    setImage(processed);
    m_tesseract->Recognize(nullptr);

    char *outText = m_tesseract->GetUTF8Text();
    if (outText) {
      text = outText;
      delete[] outText;
    }
    m_ocrPages++;
  } catch (const std::exception &e) {
    std::cerr << "WARNING: OCR failed on page " << (index + 1) << ": "
              << e.what() << std::endl;
    return "";
  }

  if (m_config.verbose) {
    auto endTime = std::chrono::high_resolution_clock::now();
    std::cerr << "DEBUG: OCR of page " << (index + 1) << " took "
              << std::chrono::duration<double, std::milli>(endTime - startTime)
                     .count()
              << " ms, " << text.size() << " bytes" << std::endl;
  }

  return text;
}

cv::Mat PdfPageSource::toMat(const poppler::image &image) const {
  int type = -1;
  switch (image.format()) {
  case poppler::image::format_argb32:
    type = CV_8UC4; // BGRA byte order in memory
    break;
  case poppler::image::format_rgb24:
  case poppler::image::format_bgr24:
    type = CV_8UC3;
    break;
  case poppler::image::format_gray8:
    type = CV_8UC1;
    break;
  default:
    return cv::Mat();
  }

  // The renderer owns the buffer, so wrap it and copy out
  cv::Mat wrapped(image.height(), image.width(), type,
                  const_cast<char *>(image.const_data()), image.bytes_per_row());
  if (image.format() == poppler::image::format_rgb24) {
    cv::Mat bgr;
    cv::cvtColor(wrapped, bgr, cv::COLOR_RGB2BGR);
    return bgr;
  }
  return wrapped.clone();
}

namespace {

/// Gray, BGR or BGRA input to a 1-channel gray or 3-channel RGB image
cv::Mat convertForOcr(const cv::Mat &image, bool gray) {
  int code = -1;
  switch (image.channels()) {
  case 1:
    code = gray ? -1 : cv::COLOR_GRAY2RGB;
    break;
  case 3:
    code = gray ? cv::COLOR_BGR2GRAY : cv::COLOR_BGR2RGB;
    break;
  case 4:
    code = gray ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGRA2RGB;
    break;
  default:
    throw std::runtime_error("Unsupported channel count " +
                             std::to_string(image.channels()));
  }

  if (code < 0) {
    return image;
  }
  cv::Mat converted;
  cv::cvtColor(image, converted, code);
  return converted;
}

} // namespace

cv::Mat PdfPageSource::preprocessImage(const cv::Mat &image) const {
  cv::Mat binary = convertForOcr(image, true).clone();

  // Smooth scanner speckle, then binarize per neighbourhood
  cv::GaussianBlur(binary, binary, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(binary, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, 11, 2);
  return binary;
}

void PdfPageSource::setImage(const cv::Mat &image) {
  // Single-channel images go in as they are, colour pages as packed RGB
  cv::Mat pixels = convertForOcr(image, image.channels() == 1);
  if (!pixels.isContinuous()) {
    pixels = pixels.clone();
  }
  m_tesseract->SetImage(pixels.data, pixels.cols, pixels.rows,
                        pixels.channels(), static_cast<int>(pixels.step));
}

} // namespace cusplit
