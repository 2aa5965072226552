#ifndef CUSPLIT_PDF_PAGE_SOURCE_HPP
#define CUSPLIT_PDF_PAGE_SOURCE_HPP

#include "cusplit/PageSource.hpp"

#include <opencv2/opencv.hpp>
#include <poppler-document.h>
#include <poppler-page.h>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>

namespace cusplit {

/**
 * @brief Configuration options for reading a PDF
 */
struct PdfSourceConfig {
  bool ocrFallback = false;    ///< OCR pages whose text layer is empty
  std::string language = "ita"; ///< Tesseract language code(s), e.g. "ita+eng"
  std::string tessDataPath;    ///< Path to tessdata (empty = TESSDATA_PREFIX)
  double dpi = 300.0;          ///< Rendering resolution for OCR
  bool preprocessImage = true; ///< Grayscale + adaptive threshold before OCR
  bool verbose = false;        ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of opening a PDF
 */
struct PdfOpenResult {
  bool success = false;     ///< Whether the document is readable
  std::string errorMessage; ///< Error message if failed
  int pageCount = 0;        ///< Number of pages
};

/**
 * @brief PageTextSource backed by Poppler, with an optional Tesseract pass for
 * scanned pages
 *
 * The text of a page is rebuilt from Poppler's word boxes: words flagged with a
 * trailing space are separated by a space and a change of baseline starts a new
 * line. When the page carries no text and OCR fallback is enabled, the page is
 * rendered with poppler::page_renderer and recognized with Tesseract.
 *
 * Example usage:
 * @code
 * cusplit::PdfPageSource source;
 * auto opened = source.open("cu_2025.pdf");
 * if (opened.success) {
 *   auto extraction = cusplit::runExtraction(source);
 * }
 * @endcode
 */
class PdfPageSource : public PageTextSource {
public:
  PdfPageSource();
  explicit PdfPageSource(const PdfSourceConfig &config);
  ~PdfPageSource() override;

  // Disable copy operations (Poppler document and Tesseract API are not
  // copyable)
  PdfPageSource(const PdfPageSource &) = delete;
  PdfPageSource &operator=(const PdfPageSource &) = delete;

  /**
   * @brief Load a PDF file
   * @param pdfPath Path to the PDF file
   * @return PdfOpenResult; a missing, unreadable or password protected file
   * is a failure
   */
  PdfOpenResult open(const std::string &pdfPath);

  bool isOpen() const;

  int pageCount() const override;

  /**
   * @throws std::runtime_error if no document is open or the page cannot be
   * created
   */
  std::string pageText(int index) override;

  /// Pages whose text came from OCR so far
  int ocrPageCount() const;

  /// Tesseract version string
  static std::string getTesseractVersion();

private:
  /// Text layer of a page, empty for scanned pages
  std::string embeddedText(poppler::page &page) const;

  /// Lazily initialize Tesseract; false if unavailable
  bool initializeOcr();

  /// Render a page and run OCR on it
  std::string recognizePage(poppler::page &page, int index);

  /// Copy a rendered page into a Mat (BGRA, BGR or gray); empty if the
  /// pixel format is not handled
  cv::Mat toMat(const poppler::image &image) const;

  /// Gray, smoothed and adaptively thresholded copy of a page image
  cv::Mat preprocessImage(const cv::Mat &image) const;

  /// Hand a gray or colour image to Tesseract
  void setImage(const cv::Mat &image);

  std::unique_ptr<poppler::document> m_document; ///< Loaded PDF
  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;          ///< Tesseract API instance
  PdfSourceConfig m_config; ///< Current configuration
  bool m_ocrInitialized;    ///< Tesseract ready
  bool m_ocrUnavailable;    ///< Tesseract failed to initialize once
  int m_ocrPages;           ///< Pages recognized with OCR
};

} // namespace cusplit

#endif // CUSPLIT_PDF_PAGE_SOURCE_HPP
