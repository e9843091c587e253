#include "pdf_objects.h"
#include "pdf_report_canvas.h"
#include "pdf_writer.h"

#include <iostream>
#include <sstream>

using namespace report_pdf_internal;

int main() {
  std::vector<PdfObject> objects;
  objects.push_back({"<< /Type /Catalog /Pages 2 0 R >>"});
  objects.push_back({"<< /Type /Pages /Kids [3 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Page /Parent 2 0 R /MediaBox [0 0 100 100] /Contents 4 0 R >>"});
  objects.push_back({"<< /Length 0 >>\nstream\n\nendstream"});

  std::string data;
  std::string error;
  if (!SerializePdfDocument(objects, 1, 0, data, error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  if (data.find("xref") == std::string::npos || data.find("%%EOF") == std::string::npos) {
    std::cerr << "Missing xref or EOF markers" << std::endl;
    return 1;
  }
  // Cross-reference offsets point at the objects
  size_t third = data.find("3 0 obj");
  std::ostringstream entry;
  entry.width(10);
  entry.fill('0');
  entry << third;
  if (data.find(entry.str() + " 00000 n") == std::string::npos) {
    std::cerr << "xref offset does not match object position" << std::endl;
    return 1;
  }
  if (SerializePdfDocument(objects, 9, 0, data, error)) {
    std::cerr << "Out of range catalog accepted" << std::endl;
    return 1;
  }

  if (EscapePdfString("a(b)c\\") != "a\\(b\\)c\\\\") {
    std::cerr << "String escaping is wrong" << std::endl;
    return 1;
  }
  if (FloatFormatter(2).Format(12.0) != "12.00" || FloatFormatter(0).Format(3.4) != "3") {
    std::cerr << "Unexpected float formatting" << std::endl;
    return 1;
  }

  // Canvas output: uncompressed so the drawing operators can be checked
  PdfReportCanvas canvas(200.0, 100.0, "Demo (draft)");
  canvas.SetCompressStreams(false);
  if (canvas.Serialize(data, error)) {
    std::cerr << "Empty document serialized" << std::endl;
    return 1;
  }
  canvas.BeginPage();
  CanvasTextStyle bold;
  bold.bold = true;
  bold.fontSize = 12.0f;
  canvas.DrawText(10.0, 20.0, "Finding (1)", bold);
  canvas.FillRect(0.0, 0.0, 50.0, 10.0, CanvasColor::FromRgb(0x2563eb));
  canvas.DrawLine(0.0, 50.0, 200.0, 50.0, CanvasStroke{CanvasColor::FromRgb(0xe6e6e6), 0.5f});
  EncodedImage image;
  image.data = "\xFF\xD8 fake jpeg \xFF\xD9";
  image.width = 4;
  image.height = 2;
  canvas.BeginPage();
  canvas.DrawImage(image, 10.0, 10.0, 40.0, 20.0);
  canvas.DrawImage(EncodedImage(), 0.0, 0.0, 1.0, 1.0);

  if (canvas.PageCount() != 2 || canvas.ImageCount() != 1) {
    std::cerr << "Unexpected page or image count" << std::endl;
    return 1;
  }
  if (!canvas.Serialize(data, error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  const char *expected[] = {
      "/Count 2",
      "/BaseFont /Helvetica ",
      "/BaseFont /Helvetica-Bold",
      "/Encoding /WinAnsiEncoding",
      "/Title (Demo \\(draft\\))",
      "/F2 12.00 Tf\n10.00 80.00 Td\n(Finding \\(1\\)) Tj",
      "0.00 90.00 50.00 10.00 re\nf",
      "0.00 50.00 m\n200.00 50.00 l\nS",
      "/Subtype /Image /Width 4 /Height 2",
      "/Filter /DCTDecode",
      "40.00 0 0 20.00 10.00 70.00 cm\n/Im1 Do",
      "/XObject << /Im1 ",
      "/MediaBox [0 0 200.00 100.00]"};
  for (const char *marker : expected) {
    if (data.find(marker) == std::string::npos) {
      std::cerr << "Missing PDF fragment: " << marker << std::endl;
      return 1;
    }
  }

  // Compressed streams use FlateDecode
  PdfReportCanvas compressed(200.0, 100.0);
  compressed.BeginPage();
  compressed.DrawText(10.0, 20.0, "Hello", CanvasTextStyle());
  if (!compressed.Serialize(data, error) ||
      data.find("/Filter /FlateDecode") == std::string::npos) {
    std::cerr << "Content stream not compressed" << std::endl;
    return 1;
  }

  // Measurement matches the Helvetica tables
  if (compressed.MeasureText("Hello", 10.0, false) !=
      MeasureTextWidth("Hello", 10.0, StandardFont::Helvetica)) {
    std::cerr << "Canvas measurement disagrees with font metrics" << std::endl;
    return 1;
  }
  return 0;
}
