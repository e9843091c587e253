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

#include <cstdint>
#include <string>

#include "../models/types.h"

// Simple RGBA color container expressed in floating point values.
struct CanvasColor {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;

  // Builds a color from a 24-bit 0xRRGGBB value.
  static constexpr CanvasColor FromRgb(uint32_t rgb, float alpha = 1.0f) {
    return CanvasColor{((rgb >> 16) & 0xFF) / 255.0f,
                       ((rgb >> 8) & 0xFF) / 255.0f, (rgb & 0xFF) / 255.0f,
                       alpha};
  }

  CanvasColor WithAlpha(float alpha) const { return {r, g, b, alpha}; }
};

// Basic line style description shared by commands that involve strokes.
struct CanvasStroke {
  CanvasColor color{};
  float width = 1.0f;
};

// Fill style used by rectangles and circles.
struct CanvasFill {
  CanvasColor color{};
};

// Describes text appearance. The anchor passed with the text is the baseline
// point that respects the horizontal alignment.
struct CanvasTextStyle {
  float fontSize = 10.0f;
  bool bold = false;
  CanvasColor color{};
  enum class HorizontalAlign { Left, Center, Right } hAlign =
      HorizontalAlign::Left;
};

// Encoded raster ready to be embedded in a document. Only baseline JPEG data
// is produced by the raster backends.
struct EncodedImage {
  std::string data;
  int width = 0;
  int height = 0;

  bool IsValid() const { return !data.empty() && width > 0 && height > 0; }
};

// Fixed color encoding of finding severity. Medium and Low share the
// standard color.
struct PriorityPalette {
  CanvasColor critical = CanvasColor::FromRgb(0xdc2626);
  CanvasColor high = CanvasColor::FromRgb(0xf97316);
  CanvasColor standard = CanvasColor::FromRgb(0x2563eb);

  const CanvasColor &ColorFor(Priority priority) const {
    switch (priority) {
    case Priority::Critical:
      return critical;
    case Priority::High:
      return high;
    case Priority::Medium:
    case Priority::Low:
      return standard;
    }
    return standard;
  }
};
