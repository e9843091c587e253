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

#include <wx/graphics.h>
#include <wx/image.h>

#include "rastersurface.h"

// Raster surface over a wxImage. Drawing goes through a wxGraphicsContext
// created on first use; the context is released before encoding so the
// pixels are written back into the image.
class WxRasterSurface : public IRasterSurface {
public:
  explicit WxRasterSurface(wxImage image);
  ~WxRasterSurface() override;

  int Width() const override;
  int Height() const override;

  void FillCircle(double cx, double cy, double radius,
                  const CanvasColor &color) override;
  void StrokeCircle(double cx, double cy, double radius,
                    const CanvasStroke &stroke) override;
  void DrawCenteredText(const std::string &text, double cx, double cy,
                        double fontSize, bool bold,
                        const CanvasColor &color) override;

  bool EncodeJpeg(int quality, EncodedImage &out, std::string &error) override;

  const wxImage &Image() const { return image_; }

private:
  wxGraphicsContext *Context();
  void FlushContext();

  wxImage image_;
  std::unique_ptr<wxGraphicsContext> context_;
};

// Decodes any format registered with wxInitAllImageHandlers (PNG, JPEG, BMP,
// GIF). Transparent areas are flattened onto white so the JPEG output
// matches what a viewer shows.
class WxRasterBackend : public IRasterBackend {
public:
  std::unique_ptr<IRasterSurface> Decode(const std::string &payload,
                                         std::string &error) const override;
};
