#pragma once

#include <sstream>
#include <string>
#include <vector>

#include "../reportcanvas.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"

namespace report_pdf_internal {

class GraphicsStateCache {
public:
  void SetStroke(std::ostringstream &out, const CanvasStroke &stroke,
                 const FloatFormatter &fmt);
  void SetFill(std::ostringstream &out, const CanvasColor &color,
               const FloatFormatter &fmt);

private:
  CanvasColor strokeColor_{};
  CanvasColor fillColor_{};
  double lineWidth_ = -1.0;
  bool hasStrokeColor_ = false;
  bool hasFillColor_ = false;
  bool hasLineWidth_ = false;
  bool capStyleSet_ = false;
};

} // namespace report_pdf_internal

// Report canvas that records drawing as PDF page content and serializes a
// complete PDF 1.4 file. Text uses Helvetica (/F1) and Helvetica-Bold (/F2);
// images must already be JPEG encoded.
class PdfReportCanvas : public IReportCanvas {
public:
  PdfReportCanvas(double pageWidth, double pageHeight, std::string title = {});

  double PageWidth() const override { return pageWidth_; }
  double PageHeight() const override { return pageHeight_; }
  void BeginPage() override;
  size_t PageCount() const override { return pages_.size(); }

  double MeasureText(const std::string &text, double fontSize,
                     bool bold) const override;

  void DrawText(double x, double baselineY, const std::string &text,
                const CanvasTextStyle &style) override;
  void DrawLine(double x0, double y0, double x1, double y1,
                const CanvasStroke &stroke) override;
  void FillRect(double x, double y, double w, double h,
                const CanvasColor &color) override;
  void DrawImage(const EncodedImage &image, double x, double y, double w,
                 double h) override;

  size_t ImageCount() const { return images_.size(); }
  void SetCompressStreams(bool compress) { compressStreams_ = compress; }

  bool Serialize(std::string &out, std::string &error) const;

private:
  struct Page {
    std::ostringstream content;
    report_pdf_internal::GraphicsStateCache cache;
    std::vector<size_t> images;
  };

  Page &CurrentPage();
  double FlipY(double y) const { return pageHeight_ - y; }

  double pageWidth_;
  double pageHeight_;
  std::string title_;
  bool compressStreams_ = true;
  report_pdf_internal::FloatFormatter fmt_{2};
  std::vector<Page> pages_;
  std::vector<EncodedImage> images_;
};
