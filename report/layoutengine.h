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
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../core/reportconfig.h"
#include "../models/observation.h"
#include "reportcanvas.h"

// Breaks text into lines no wider than maxWidth. Explicit newlines always
// start a new line; a single word wider than maxWidth is split between
// characters. Empty input yields one empty line.
std::vector<std::string> WrapText(const ITextMeasurer &measurer,
                                  const std::string &text, double maxWidth,
                                  double fontSize, bool bold = false);

inline double TextBlockHeight(size_t lineCount, double lineHeight) {
  return static_cast<double>(lineCount) * lineHeight;
}

// ceil(count / perRow) rows of (cellSize + cellSpacing); zero images take no
// space.
double ImageGridHeight(size_t imageCount, const ReportStyle &style);

struct GridCell {
  double x = 0.0;
  double y = 0.0;
  double size = 0.0;
};

// Top-left corner of the cell holding image `index` in a grid whose first
// cell starts at (originX, originY). Cells advance by cellSize + cellSpacing
// in both directions.
GridCell ImageGridCell(size_t index, double originX, double originY,
                       const ReportStyle &style);

// Largest w x h with the image's aspect ratio that fits inside a box.
void FitInside(double imageWidth, double imageHeight, double boxWidth,
               double boxHeight, double &outWidth, double &outHeight);

// Wrapped content and total height of one finding block. The block is laid
// out as: header, metadata lines, wrapped description and recommended
// action, photo grid, trailing spacing.
struct FindingBlockLayout {
  std::vector<std::string> descriptionLines;
  std::vector<std::string> actionLines;
  size_t metadataLines = 2;
  size_t photoCount = 0;
  double textHeight = 0.0;
  double gridHeight = 0.0;
  double height = 0.0;
};

FindingBlockLayout MeasureFindingBlock(const ITextMeasurer &measurer,
                                       const ReportStyle &style,
                                       const Observation &observation,
                                       size_t photoCount);

// Vertical write position on the current page, measured from the top edge.
class PageCursor {
public:
  explicit PageCursor(const ReportStyle &style);

  double Y() const { return y_; }
  double Top() const { return top_; }
  double Bottom() const { return bottom_; }
  bool AtTop() const { return y_ <= top_; }

  // True when a block of this height ends on or above the bottom margin.
  bool Fits(double height) const { return y_ + height <= bottom_; }

  void Advance(double dy) { y_ += dy; }
  void MoveTo(double y) { y_ = y; }
  void ResetToTop() { y_ = top_; }

private:
  double top_;
  double bottom_;
  double y_;
};

struct PlacementDecision {
  bool newPage = false;
  // Taller than an empty page; placed anyway and allowed to run past the
  // bottom margin.
  bool oversized = false;
};

// Blocks are never split: they go on the current page when they fit,
// otherwise on a fresh page. The cursor is not moved.
PlacementDecision DecidePlacement(const PageCursor &cursor, double height,
                                  const std::string &label);

bool LayoutTraceEnabled();
