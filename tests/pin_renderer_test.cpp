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
#include "../render/pinrenderer.h"
#include "testfakes.h"

#include <cassert>
#include <cmath>

namespace {
bool Near(double a, double b) { return std::abs(a - b) < 1e-6; }

bool SameRgb(const CanvasColor &a, const CanvasColor &b) {
  return Near(a.r, b.r) && Near(a.g, b.g) && Near(a.b, b.b);
}
} // namespace

int main() {
  PriorityPalette palette;
  const CanvasColor red = CanvasColor::FromRgb(0xdc2626);
  const CanvasColor orange = CanvasColor::FromRgb(0xf97316);
  const CanvasColor blue = CanvasColor::FromRgb(0x2563eb);

  assert(SameRgb(palette.ColorFor(Priority::Critical), red));
  assert(SameRgb(palette.ColorFor(Priority::High), orange));
  assert(SameRgb(palette.ColorFor(Priority::Medium), blue));
  assert(SameRgb(palette.ColorFor(Priority::Low), blue));

  // Radius follows the larger side of the target
  PinAppearance wide = ComputePinAppearance(Priority::High, 2000, 1000, palette);
  assert(Near(wide.radius, 30.0));
  assert(Near(wide.glowRadius, 45.0));
  assert(Near(wide.ringWidth, 6.0));
  assert(Near(wide.fontSize, 30.0));
  PinAppearance tall = ComputePinAppearance(Priority::High, 1000, 2000, palette);
  assert(Near(tall.radius, wide.radius));

  FakeRasterSurface surface(1000, 800);
  DrawPin(surface, PixelPoint{120.0, 340.0}, "7", Priority::Critical, palette);
  assert(surface.ops.size() == 4);

  const RasterOp &glow = surface.ops[0];
  assert(glow.kind == RasterOp::Kind::FillCircle);
  assert(Near(glow.radius, 22.5));
  assert(SameRgb(glow.color, red));
  assert(Near(glow.color.a, 0.2));

  const RasterOp &disc = surface.ops[1];
  assert(disc.kind == RasterOp::Kind::FillCircle);
  assert(Near(disc.radius, 15.0));
  assert(Near(disc.color.a, 1.0));

  const RasterOp &ring = surface.ops[2];
  assert(ring.kind == RasterOp::Kind::StrokeCircle);
  assert(Near(ring.radius, 15.0));
  assert(Near(ring.strokeWidth, 3.0));
  assert(SameRgb(ring.color, CanvasColor::FromRgb(0xffffff)));

  const RasterOp &label = surface.ops[3];
  assert(label.kind == RasterOp::Kind::Text);
  assert(label.text == "7");
  assert(label.bold);
  assert(Near(label.fontSize, 15.0));
  assert(Near(label.x, 120.0) && Near(label.y, 340.0));
  return 0;
}
