#include "pdf_report_canvas.h"

#include <cmath>
#include <utility>

#include "logger.h"

namespace report_pdf_internal {

namespace {
bool SameColor(const CanvasColor &a, const CanvasColor &b) {
  return std::abs(a.r - b.r) < 1e-6 && std::abs(a.g - b.g) < 1e-6 &&
         std::abs(a.b - b.b) < 1e-6;
}

const FloatFormatter &ColorFormatter() {
  static const FloatFormatter fmt(3);
  return fmt;
}
} // namespace

void GraphicsStateCache::SetStroke(std::ostringstream &out,
                                   const CanvasStroke &stroke,
                                   const FloatFormatter &fmt) {
  if (!capStyleSet_) {
    out << "0 J\n";
    capStyleSet_ = true;
  }
  const FloatFormatter &cf = ColorFormatter();
  if (!hasStrokeColor_ || !SameColor(stroke.color, strokeColor_)) {
    out << cf.Format(stroke.color.r) << ' ' << cf.Format(stroke.color.g) << ' '
        << cf.Format(stroke.color.b) << " RG\n";
    strokeColor_ = stroke.color;
    hasStrokeColor_ = true;
  }
  if (!hasLineWidth_ || std::abs(stroke.width - lineWidth_) > 1e-6) {
    out << fmt.Format(stroke.width) << " w\n";
    lineWidth_ = stroke.width;
    hasLineWidth_ = true;
  }
}

void GraphicsStateCache::SetFill(std::ostringstream &out,
                                 const CanvasColor &color,
                                 const FloatFormatter &) {
  if (!hasFillColor_ || !SameColor(color, fillColor_)) {
    const FloatFormatter &cf = ColorFormatter();
    out << cf.Format(color.r) << ' ' << cf.Format(color.g) << ' '
        << cf.Format(color.b) << " rg\n";
    fillColor_ = color;
    hasFillColor_ = true;
  }
}

} // namespace report_pdf_internal

using namespace report_pdf_internal;

PdfReportCanvas::PdfReportCanvas(double pageWidth, double pageHeight,
                                 std::string title)
    : pageWidth_(pageWidth), pageHeight_(pageHeight), title_(std::move(title)) {
}

void PdfReportCanvas::BeginPage() { pages_.emplace_back(); }

PdfReportCanvas::Page &PdfReportCanvas::CurrentPage() {
  if (pages_.empty())
    BeginPage();
  return pages_.back();
}

double PdfReportCanvas::MeasureText(const std::string &text, double fontSize,
                                    bool bold) const {
  return MeasureTextWidth(EncodeWinAnsi(text), fontSize,
                          bold ? StandardFont::HelveticaBold
                               : StandardFont::Helvetica);
}

void PdfReportCanvas::DrawText(double x, double baselineY,
                               const std::string &text,
                               const CanvasTextStyle &style) {
  if (text.empty())
    return;
  Page &page = CurrentPage();
  std::string encoded = EncodeWinAnsi(text);
  StandardFont font =
      style.bold ? StandardFont::HelveticaBold : StandardFont::Helvetica;
  double width = MeasureTextWidth(encoded, style.fontSize, font);
  double drawX = x;
  if (style.hAlign == CanvasTextStyle::HorizontalAlign::Center)
    drawX -= width / 2.0;
  else if (style.hAlign == CanvasTextStyle::HorizontalAlign::Right)
    drawX -= width;

  page.cache.SetFill(page.content, style.color, fmt_);
  page.content << "BT\n/" << (style.bold ? "F2 " : "F1 ")
               << fmt_.Format(style.fontSize) << " Tf\n"
               << fmt_.Format(drawX) << ' ' << fmt_.Format(FlipY(baselineY))
               << " Td\n(" << EscapePdfString(encoded) << ") Tj\nET\n";
}

void PdfReportCanvas::DrawLine(double x0, double y0, double x1, double y1,
                               const CanvasStroke &stroke) {
  Page &page = CurrentPage();
  page.cache.SetStroke(page.content, stroke, fmt_);
  page.content << fmt_.Format(x0) << ' ' << fmt_.Format(FlipY(y0)) << " m\n"
               << fmt_.Format(x1) << ' ' << fmt_.Format(FlipY(y1))
               << " l\nS\n";
}

void PdfReportCanvas::FillRect(double x, double y, double w, double h,
                               const CanvasColor &color) {
  Page &page = CurrentPage();
  page.cache.SetFill(page.content, color, fmt_);
  page.content << fmt_.Format(x) << ' ' << fmt_.Format(FlipY(y + h)) << ' '
               << fmt_.Format(w) << ' ' << fmt_.Format(h) << " re\nf\n";
}

void PdfReportCanvas::DrawImage(const EncodedImage &image, double x, double y,
                                double w, double h) {
  if (!image.IsValid()) {
    Logger::Instance().Log(LogLevel::Warning,
                           "PDF canvas: ignoring empty image");
    return;
  }
  Page &page = CurrentPage();
  images_.push_back(image);
  size_t imageNumber = images_.size();
  page.images.push_back(imageNumber);
  page.content << "q\n"
               << fmt_.Format(w) << " 0 0 " << fmt_.Format(h) << ' '
               << fmt_.Format(x) << ' ' << fmt_.Format(FlipY(y + h))
               << " cm\n/Im" << imageNumber << " Do\nQ\n";
}

bool PdfReportCanvas::Serialize(std::string &out, std::string &error) const {
  if (pages_.empty()) {
    error = "Document has no pages.";
    return false;
  }

  std::vector<PdfObject> objects;
  objects.push_back({"<< /Type /Catalog /Pages 2 0 R >>"});
  objects.push_back({});
  size_t regularFont = AppendStandardFont(objects, StandardFont::Helvetica);
  size_t boldFont = AppendStandardFont(objects, StandardFont::HelveticaBold);

  std::ostringstream info;
  info << "<< /Producer (Inspectra)";
  if (!title_.empty())
    info << " /Title (" << EscapePdfString(EncodeWinAnsi(title_)) << ")";
  info << " >>";
  objects.push_back({info.str()});
  size_t infoObject = objects.size();

  std::vector<size_t> imageObjects;
  imageObjects.reserve(images_.size());
  for (const EncodedImage &image : images_)
    imageObjects.push_back(AppendJpegImage(objects, image));

  std::vector<size_t> pageObjects;
  pageObjects.reserve(pages_.size());
  for (const Page &page : pages_) {
    size_t contentObject =
        AppendContentStream(objects, page.content.str(), compressStreams_);

    std::ostringstream pageObj;
    pageObj << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "
            << fmt_.Format(pageWidth_) << ' ' << fmt_.Format(pageHeight_)
            << "] /Resources << /Font << /F1 " << regularFont << " 0 R /F2 "
            << boldFont << " 0 R >>";
    if (!page.images.empty()) {
      pageObj << " /XObject <<";
      for (size_t imageNumber : page.images)
        pageObj << " /Im" << imageNumber << ' '
                << imageObjects[imageNumber - 1] << " 0 R";
      pageObj << " >>";
    }
    pageObj << " >> /Contents " << contentObject << " 0 R >>";
    objects.push_back({pageObj.str()});
    pageObjects.push_back(objects.size());
  }

  std::ostringstream pagesObj;
  pagesObj << "<< /Type /Pages /Kids [";
  for (size_t i = 0; i < pageObjects.size(); ++i) {
    if (i)
      pagesObj << ' ';
    pagesObj << pageObjects[i] << " 0 R";
  }
  pagesObj << "] /Count " << pageObjects.size() << " >>";
  objects[1].body = pagesObj.str();

  return SerializePdfDocument(objects, 1, infoObject, out, error);
}
