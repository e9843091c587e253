/*
 * This file is part of Inspectra.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Inspectra is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Inspectra is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Inspectra. If not, see <https://www.gnu.org/licenses/>.
 */

#include "layoutengine.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "logger.h"

namespace {

std::vector<std::string> SplitParagraphs(const std::string &text) {
  std::vector<std::string> paragraphs;
  std::string current;
  for (char ch : text) {
    if (ch == '\r')
      continue;
    if (ch == '\n') {
      paragraphs.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  paragraphs.push_back(current);
  return paragraphs;
}

std::vector<std::string> SplitWords(const std::string &paragraph) {
  std::vector<std::string> words;
  std::string word;
  for (char ch : paragraph) {
    if (ch == ' ' || ch == '\t') {
      if (!word.empty())
        words.push_back(word);
      word.clear();
    } else {
      word.push_back(ch);
    }
  }
  if (!word.empty())
    words.push_back(word);
  return words;
}

size_t CodePointLength(const std::string &s, size_t pos) {
  unsigned char lead = static_cast<unsigned char>(s[pos]);
  size_t len = 1;
  if ((lead >> 5) == 0x6)
    len = 2;
  else if ((lead >> 4) == 0xE)
    len = 3;
  else if ((lead >> 3) == 0x1E)
    len = 4;
  return std::min(len, s.size() - pos);
}

// Splits a word wider than maxWidth. Every chunk holds at least one code
// point. The last chunk is returned through `rest`.
void BreakWord(const ITextMeasurer &measurer, const std::string &word,
               double maxWidth, double fontSize, bool bold,
               std::vector<std::string> &lines, std::string &rest) {
  std::string chunk;
  size_t pos = 0;
  while (pos < word.size()) {
    size_t len = CodePointLength(word, pos);
    std::string candidate = chunk + word.substr(pos, len);
    if (!chunk.empty() &&
        measurer.MeasureText(candidate, fontSize, bold) > maxWidth) {
      lines.push_back(chunk);
      chunk = word.substr(pos, len);
    } else {
      chunk.swap(candidate);
    }
    pos += len;
  }
  rest = chunk;
}

} // namespace

std::vector<std::string> WrapText(const ITextMeasurer &measurer,
                                  const std::string &text, double maxWidth,
                                  double fontSize, bool bold) {
  std::vector<std::string> lines;
  for (const std::string &paragraph : SplitParagraphs(text)) {
    std::string current;
    for (const std::string &word : SplitWords(paragraph)) {
      std::string candidate = current.empty() ? word : current + " " + word;
      if (measurer.MeasureText(candidate, fontSize, bold) <= maxWidth) {
        current.swap(candidate);
        continue;
      }
      if (!current.empty())
        lines.push_back(current);
      current.clear();
      if (measurer.MeasureText(word, fontSize, bold) <= maxWidth)
        current = word;
      else
        BreakWord(measurer, word, maxWidth, fontSize, bold, lines, current);
    }
    lines.push_back(current);
  }
  return lines;
}

double ImageGridHeight(size_t imageCount, const ReportStyle &style) {
  if (imageCount == 0 || style.perRow <= 0)
    return 0.0;
  size_t perRow = static_cast<size_t>(style.perRow);
  size_t rows = (imageCount + perRow - 1) / perRow;
  return static_cast<double>(rows) * (style.cellSizePt + style.cellSpacingPt);
}

GridCell ImageGridCell(size_t index, double originX, double originY,
                       const ReportStyle &style) {
  size_t perRow = static_cast<size_t>(std::max(style.perRow, 1));
  double pitch = style.cellSizePt + style.cellSpacingPt;
  GridCell cell;
  cell.x = originX + static_cast<double>(index % perRow) * pitch;
  cell.y = originY + static_cast<double>(index / perRow) * pitch;
  cell.size = style.cellSizePt;
  return cell;
}

void FitInside(double imageWidth, double imageHeight, double boxWidth,
               double boxHeight, double &outWidth, double &outHeight) {
  if (imageWidth <= 0.0 || imageHeight <= 0.0) {
    outWidth = boxWidth;
    outHeight = boxHeight;
    return;
  }
  double scale = std::min(boxWidth / imageWidth, boxHeight / imageHeight);
  outWidth = imageWidth * scale;
  outHeight = imageHeight * scale;
}

FindingBlockLayout MeasureFindingBlock(const ITextMeasurer &measurer,
                                       const ReportStyle &style,
                                       const Observation &observation,
                                       size_t photoCount) {
  FindingBlockLayout layout;
  double width = style.ContentWidth();
  layout.descriptionLines =
      WrapText(measurer, "Description: " + observation.note, width,
               style.bodyFontSize);
  if (!observation.recommendedAction.empty())
    layout.actionLines =
        WrapText(measurer, "Recommended action: " + observation.recommendedAction,
                 width, style.bodyFontSize);
  layout.photoCount = photoCount;

  size_t textLines = layout.descriptionLines.size() + layout.actionLines.size();
  layout.textHeight = TextBlockHeight(textLines, style.lineHeightPt);
  layout.gridHeight = ImageGridHeight(photoCount, style);
  layout.height = style.blockHeaderHeightPt +
                  static_cast<double>(layout.metadataLines) *
                      style.metadataLineHeightPt +
                  layout.textHeight + layout.gridHeight + style.blockSpacingPt;
  return layout;
}

PageCursor::PageCursor(const ReportStyle &style)
    : top_(style.marginPt), bottom_(style.ContentBottom()), y_(style.marginPt) {
}

bool LayoutTraceEnabled() {
  static const bool enabled = [] {
    const char *value = std::getenv("INSPECTRA_TRACE_LAYOUT");
    return value && *value && std::string(value) != "0";
  }();
  return enabled;
}

PlacementDecision DecidePlacement(const PageCursor &cursor, double height,
                                  const std::string &label) {
  PlacementDecision decision;
  decision.newPage = !cursor.Fits(height) && !cursor.AtTop();
  decision.oversized = height > cursor.Bottom() - cursor.Top();

  if (LayoutTraceEnabled()) {
    std::ostringstream ss;
    ss << "layout: " << label << " height=" << height << " cursor="
       << cursor.Y() << " bottom=" << cursor.Bottom()
       << (decision.newPage ? " -> new page" : " -> current page");
    Logger::Instance().Log(ss.str());
  }
  if (decision.oversized)
    Logger::Instance().Log(LogLevel::Warning,
                           label + " is taller than a page; placed unsplit");
  return decision;
}
