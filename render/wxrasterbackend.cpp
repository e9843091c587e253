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

#include "wxrasterbackend.h"

#include <algorithm>
#include <cmath>

#include <wx/font.h>
#include <wx/log.h>
#include <wx/mstream.h>

namespace {
wxColour ToWxColour(const CanvasColor &color) {
  auto channel = [](float v) {
    return static_cast<unsigned char>(
        std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
  };
  return wxColour(channel(color.r), channel(color.g), channel(color.b),
                  channel(color.a));
}

void FlattenOntoWhite(wxImage &image) {
  if (image.HasMask() && !image.HasAlpha())
    image.InitAlpha();
  if (!image.HasAlpha())
    return;
  unsigned char *rgb = image.GetData();
  const unsigned char *alpha = image.GetAlpha();
  const size_t pixelCount = static_cast<size_t>(image.GetWidth()) *
                            static_cast<size_t>(image.GetHeight());
  for (size_t i = 0; i < pixelCount; ++i) {
    const unsigned int a = alpha[i];
    for (size_t c = 0; c < 3; ++c) {
      unsigned char &value = rgb[i * 3 + c];
      value = static_cast<unsigned char>((value * a + 255u * (255u - a)) / 255u);
    }
  }
  image.ClearAlpha();
}
} // namespace

WxRasterSurface::WxRasterSurface(wxImage image) : image_(std::move(image)) {}

WxRasterSurface::~WxRasterSurface() = default;

int WxRasterSurface::Width() const { return image_.GetWidth(); }

int WxRasterSurface::Height() const { return image_.GetHeight(); }

wxGraphicsContext *WxRasterSurface::Context() {
  if (!context_) {
    context_.reset(wxGraphicsContext::Create(image_));
    if (context_)
      context_->SetAntialiasMode(wxANTIALIAS_DEFAULT);
  }
  return context_.get();
}

void WxRasterSurface::FlushContext() { context_.reset(); }

void WxRasterSurface::FillCircle(double cx, double cy, double radius,
                                 const CanvasColor &color) {
  wxGraphicsContext *gc = Context();
  if (!gc || radius <= 0.0)
    return;
  wxGraphicsPath path = gc->CreatePath();
  path.AddCircle(cx, cy, radius);
  gc->SetPen(wxNullGraphicsPen);
  gc->SetBrush(gc->CreateBrush(wxBrush(ToWxColour(color))));
  gc->FillPath(path);
}

void WxRasterSurface::StrokeCircle(double cx, double cy, double radius,
                                   const CanvasStroke &stroke) {
  wxGraphicsContext *gc = Context();
  if (!gc || radius <= 0.0 || stroke.width <= 0.0f)
    return;
  wxGraphicsPath path = gc->CreatePath();
  path.AddCircle(cx, cy, radius);
  gc->SetBrush(wxNullGraphicsBrush);
  gc->SetPen(gc->CreatePen(
      wxGraphicsPenInfo(ToWxColour(stroke.color)).Width(stroke.width)));
  gc->StrokePath(path);
}

void WxRasterSurface::DrawCenteredText(const std::string &text, double cx,
                                       double cy, double fontSize, bool bold,
                                       const CanvasColor &color) {
  wxGraphicsContext *gc = Context();
  const int pixelHeight = static_cast<int>(std::lround(fontSize));
  if (!gc || text.empty() || pixelHeight <= 0)
    return;
  wxFontInfo info(wxSize(0, pixelHeight));
  info.Family(wxFONTFAMILY_SWISS);
  if (bold)
    info.Bold();
  gc->SetFont(wxFont(info), ToWxColour(color));

  const wxString label = wxString::FromUTF8(text.c_str());
  double width = 0.0, height = 0.0, descent = 0.0, leading = 0.0;
  gc->GetTextExtent(label, &width, &height, &descent, &leading);
  gc->DrawText(label, cx - width / 2.0, cy - height / 2.0);
}

bool WxRasterSurface::EncodeJpeg(int quality, EncodedImage &out,
                                 std::string &error) {
  FlushContext();
  if (!image_.IsOk()) {
    error = "Surface holds no image.";
    return false;
  }
  wxImage flattened = image_.Copy();
  FlattenOntoWhite(flattened);
  flattened.SetOption(wxIMAGE_OPTION_QUALITY, std::clamp(quality, 1, 100));

  wxMemoryOutputStream stream;
  {
    wxLogNull silence;
    if (!flattened.SaveFile(stream, wxBITMAP_TYPE_JPEG)) {
      error = "JPEG encoder rejected the image.";
      return false;
    }
  }
  out.data.resize(stream.GetSize());
  stream.CopyTo(out.data.data(), out.data.size());
  out.width = flattened.GetWidth();
  out.height = flattened.GetHeight();
  return out.IsValid();
}

std::unique_ptr<IRasterSurface>
WxRasterBackend::Decode(const std::string &payload, std::string &error) const {
  if (payload.empty()) {
    error = "Image payload is empty.";
    return nullptr;
  }
  wxMemoryInputStream stream(payload.data(), payload.size());
  wxImage image;
  {
    wxLogNull silence;
    if (!image.LoadFile(stream, wxBITMAP_TYPE_ANY) || !image.IsOk()) {
      error = "Unsupported or corrupt image data.";
      return nullptr;
    }
  }
  FlattenOntoWhite(image);
  return std::make_unique<WxRasterSurface>(std::move(image));
}
