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

#include "pinrenderer.h"

#include <algorithm>

#include "rastersurface.h"

namespace {
const CanvasColor kPinWhite{1.0f, 1.0f, 1.0f, 1.0f};
} // namespace

PinAppearance ComputePinAppearance(Priority priority, int targetWidth,
                                   int targetHeight,
                                   const PriorityPalette &palette) {
  PinAppearance pin;
  pin.color = palette.ColorFor(priority);
  pin.radius = std::max(targetWidth, targetHeight) * kPinRadiusFactor;
  pin.glowRadius = pin.radius * kPinGlowScale;
  pin.ringWidth = pin.radius * kPinRingFactor;
  pin.fontSize = pin.radius;
  return pin;
}

void DrawPin(IRasterSurface &target, const PixelPoint &position,
             const std::string &label, Priority priority,
             const PriorityPalette &palette) {
  const PinAppearance pin = ComputePinAppearance(
      priority, target.Width(), target.Height(), palette);

  target.FillCircle(position.x, position.y, pin.glowRadius,
                    pin.color.WithAlpha(kPinGlowAlpha));
  target.FillCircle(position.x, position.y, pin.radius, pin.color);

  CanvasStroke ring;
  ring.color = kPinWhite;
  ring.width = static_cast<float>(pin.ringWidth);
  target.StrokeCircle(position.x, position.y, pin.radius, ring);

  target.DrawCenteredText(label, position.x, position.y, pin.fontSize, true,
                          kPinWhite);
}
