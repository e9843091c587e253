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

#include <memory>
#include <string>

#include "canvastypes.h"

// Drawing surface backed by a decoded raster at its native resolution. All
// coordinates are absolute pixels with the origin at the top-left corner.
class IRasterSurface {
public:
  virtual ~IRasterSurface() = default;

  virtual int Width() const = 0;
  virtual int Height() const = 0;

  // The alpha component of the color controls blending with the pixels
  // underneath.
  virtual void FillCircle(double cx, double cy, double radius,
                          const CanvasColor &color) = 0;
  virtual void StrokeCircle(double cx, double cy, double radius,
                            const CanvasStroke &stroke) = 0;
  // Draws text centered horizontally and vertically on (cx, cy).
  virtual void DrawCenteredText(const std::string &text, double cx, double cy,
                                double fontSize, bool bold,
                                const CanvasColor &color) = 0;

  // Flattens everything drawn so far into a baseline JPEG.
  virtual bool EncodeJpeg(int quality, EncodedImage &out,
                          std::string &error) = 0;
};

// Image decode capability. Decode must be callable concurrently from several
// threads; each call returns an independent surface.
class IRasterBackend {
public:
  virtual ~IRasterBackend() = default;

  // Returns nullptr and fills error when the payload cannot be decoded.
  virtual std::unique_ptr<IRasterSurface> Decode(const std::string &payload,
                                                 std::string &error) const = 0;
};
