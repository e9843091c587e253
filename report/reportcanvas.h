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

#include "../render/canvastypes.h"

// Width of a single line of UTF-8 text at a font size.
class ITextMeasurer {
public:
  virtual ~ITextMeasurer() = default;
  virtual double MeasureText(const std::string &text, double fontSize,
                             bool bold) const = 0;
};

// Page drawing capability used by the document assembler. Coordinates are
// points with the origin at the top-left corner of the current page; text
// is anchored on its baseline.
class IReportCanvas : public ITextMeasurer {
public:
  virtual double PageWidth() const = 0;
  virtual double PageHeight() const = 0;

  // Starts a new page; every drawing call targets the most recent page.
  virtual void BeginPage() = 0;
  virtual size_t PageCount() const = 0;

  virtual void DrawText(double x, double baselineY, const std::string &text,
                        const CanvasTextStyle &style) = 0;
  virtual void DrawLine(double x0, double y0, double x1, double y1,
                        const CanvasStroke &stroke) = 0;
  virtual void FillRect(double x, double y, double w, double h,
                        const CanvasColor &color) = 0;
  virtual void DrawImage(const EncodedImage &image, double x, double y,
                         double w, double h) = 0;
};
