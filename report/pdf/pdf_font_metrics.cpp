#include "pdf_font_metrics.h"

#include <array>
#include <cstdint>

namespace report_pdf_internal {

namespace {

// AFM widths for codes 32..126.
constexpr std::array<int, 95> kHelveticaAscii = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278,
    584, 584, 584, 556, 1015, 667, 667, 722, 722, 667, 611, 778, 722, 278,
    500, 667, 556, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 278, 278, 278, 469, 556, 333, 556, 556, 500, 556, 556,
    278, 556, 556, 222, 222, 500, 222, 833, 556, 556, 556, 556, 333, 500,
    278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

constexpr std::array<int, 95> kHelveticaBoldAscii = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333,
    584, 584, 584, 611, 975, 722, 722, 722, 722, 667, 611, 778, 722, 278,
    556, 722, 611, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 333, 278, 333, 584, 556, 333, 556, 611, 556, 611, 556,
    333, 611, 611, 278, 278, 556, 278, 889, 611, 611, 611, 611, 389, 556,
    333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

constexpr int kDefaultWidth = 556;

int UpperHalfWidth(bool bold, unsigned char code) {
  switch (code) {
  case 0x85: // ellipsis
  case 0x97: // emdash
    return 1000;
  case 0x91:
  case 0x92:
    return bold ? 278 : 222;
  case 0x93:
  case 0x94:
    return bold ? 500 : 333;
  case 0x95: // bullet
    return 350;
  case 0xA0:
    return 278;
  case 0xB0: // degree
    return 400;
  default:
    return kDefaultWidth;
  }
}

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F)
    return static_cast<unsigned char>(codepoint);
  if (codepoint >= 0xA0 && codepoint <= 0xFF)
    return static_cast<unsigned char>(codepoint);
  switch (codepoint) {
  case 0x20AC:
    return 0x80;
  case 0x201A:
    return 0x82;
  case 0x0192:
    return 0x83;
  case 0x201E:
    return 0x84;
  case 0x2026:
    return 0x85;
  case 0x2020:
    return 0x86;
  case 0x2021:
    return 0x87;
  case 0x02C6:
    return 0x88;
  case 0x2030:
    return 0x89;
  case 0x0160:
    return 0x8A;
  case 0x2039:
    return 0x8B;
  case 0x0152:
    return 0x8C;
  case 0x017D:
    return 0x8E;
  case 0x2018:
    return 0x91;
  case 0x2019:
    return 0x92;
  case 0x201C:
    return 0x93;
  case 0x201D:
    return 0x94;
  case 0x2022:
    return 0x95;
  case 0x2013:
    return 0x96;
  case 0x2014:
    return 0x97;
  case 0x02DC:
    return 0x98;
  case 0x2122:
    return 0x99;
  case 0x0161:
    return 0x9A;
  case 0x203A:
    return 0x9B;
  case 0x0153:
    return 0x9C;
  case 0x017E:
    return 0x9E;
  case 0x0178:
    return 0x9F;
  default:
    return '?';
  }
}

unsigned char ContinuationBits(const std::string &utf8, size_t pos) {
  return static_cast<unsigned char>(utf8[pos]) & 0x3F;
}

} // namespace

const char *StandardFontName(StandardFont font) {
  switch (font) {
  case StandardFont::Helvetica:
    return "Helvetica";
  case StandardFont::HelveticaBold:
    return "Helvetica-Bold";
  }
  return "Helvetica";
}

int StandardGlyphWidth(StandardFont font, unsigned char code) {
  bool bold = font == StandardFont::HelveticaBold;
  if (code >= 32 && code <= 126) {
    const auto &table = bold ? kHelveticaBoldAscii : kHelveticaAscii;
    return table[code - 32];
  }
  if (code < 32)
    return 0;
  return UpperHalfWidth(bold, code);
}

double MeasureTextWidth(const std::string &encoded, double fontSize,
                        StandardFont font) {
  long units = 0;
  for (unsigned char ch : encoded)
    units += StandardGlyphWidth(font, ch);
  return static_cast<double>(units) / 1000.0 * fontSize;
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char lead = static_cast<unsigned char>(utf8[i]);
    uint32_t codepoint = 0;
    size_t length = 0;
    if (lead < 0x80) {
      codepoint = lead;
      length = 1;
    } else if ((lead >> 5) == 0x6 && i + 1 < utf8.size()) {
      codepoint = ((lead & 0x1F) << 6) | ContinuationBits(utf8, i + 1);
      length = 2;
    } else if ((lead >> 4) == 0xE && i + 2 < utf8.size()) {
      codepoint = ((lead & 0x0F) << 12) | (ContinuationBits(utf8, i + 1) << 6) |
                  ContinuationBits(utf8, i + 2);
      length = 3;
    } else if ((lead >> 3) == 0x1E && i + 3 < utf8.size()) {
      // Nothing outside the BMP exists in WinAnsi.
      out.push_back('?');
      i += 4;
      continue;
    } else {
      out.push_back('?');
      ++i;
      continue;
    }
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(codepoint)));
    i += length;
  }
  return out;
}

} // namespace report_pdf_internal
