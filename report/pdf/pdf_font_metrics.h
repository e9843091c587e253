#pragma once

#include <string>

namespace report_pdf_internal {

// The two base-14 faces used by reports. Neither is embedded; viewers
// supply them, so widths come from the published AFM metrics.
enum class StandardFont { Helvetica, HelveticaBold };

const char *StandardFontName(StandardFont font);

// Advance width in 1/1000 em of a WinAnsi code.
int StandardGlyphWidth(StandardFont font, unsigned char code);

// Width in points of WinAnsi encoded text.
double MeasureTextWidth(const std::string &encoded, double fontSize,
                        StandardFont font);

std::string EncodeWinAnsi(const std::string &utf8);

} // namespace report_pdf_internal
