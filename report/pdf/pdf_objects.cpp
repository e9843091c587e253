#include "pdf_objects.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <zlib.h>

#include "../../render/canvastypes.h"
#include "logger.h"

namespace report_pdf_internal {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_SPEED);
  if (zres != Z_OK) {
    error = "compress2 failed";
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

std::string EscapePdfString(const std::string &encoded) {
  std::string out;
  out.reserve(encoded.size() + 8);
  for (char ch : encoded) {
    switch (ch) {
    case '(':
    case ')':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    case '\n':
    case '\r':
    case '\t':
      out.push_back(' ');
      break;
    default:
      out.push_back(ch);
    }
  }
  return out;
}

size_t AppendStandardFont(std::vector<PdfObject> &objects, StandardFont font) {
  objects.push_back({std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") +
                     StandardFontName(font) +
                     " /Encoding /WinAnsiEncoding >>"});
  return objects.size();
}

size_t AppendJpegImage(std::vector<PdfObject> &objects,
                       const EncodedImage &image) {
  std::ostringstream body;
  body << "<< /Type /XObject /Subtype /Image /Width " << image.width
       << " /Height " << image.height
       << " /ColorSpace /DeviceRGB /BitsPerComponent 8 /Filter /DCTDecode"
       << " /Length " << image.data.size() << " >>\nstream\n"
       << image.data << "\nendstream";
  objects.push_back({body.str()});
  return objects.size();
}

size_t AppendContentStream(std::vector<PdfObject> &objects,
                           const std::string &content, bool compress) {
  std::string compressed;
  bool useCompression = false;
  if (compress) {
    std::string error;
    if (PdfDeflater::Compress(content, compressed, error))
      useCompression = true;
    else
      Logger::Instance().Log(LogLevel::Warning,
                             "Content stream left uncompressed: " + error);
  }

  const std::string &streamData = useCompression ? compressed : content;
  std::ostringstream obj;
  obj << "<< /Length " << streamData.size();
  if (useCompression)
    obj << " /Filter /FlateDecode";
  obj << " >>\nstream\n" << streamData << "\nendstream";
  objects.push_back({obj.str()});
  return objects.size();
}

} // namespace report_pdf_internal
