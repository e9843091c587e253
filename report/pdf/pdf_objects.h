#pragma once

#include "pdf_font_metrics.h"
#include "pdf_writer.h"

#include <string>
#include <vector>

struct EncodedImage;

namespace report_pdf_internal {

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Escapes a WinAnsi encoded string for use inside a PDF literal string.
std::string EscapePdfString(const std::string &encoded);

// Each Append function returns the object number of the new object.
size_t AppendStandardFont(std::vector<PdfObject> &objects, StandardFont font);
size_t AppendJpegImage(std::vector<PdfObject> &objects,
                       const EncodedImage &image);
size_t AppendContentStream(std::vector<PdfObject> &objects,
                           const std::string &content, bool compress);

} // namespace report_pdf_internal
