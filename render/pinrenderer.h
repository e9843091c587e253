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

#include <string>

#include "../models/types.h"
#include "canvastypes.h"
#include "coordinatemapper.h"

// Geometry of one marker, derived from the target raster size so pins keep
// the same visual proportion on small and large plans.
struct PinAppearance {
  CanvasColor color{};
  double radius = 0.0;
  double glowRadius = 0.0;
  double ringWidth = 0.0;
  double fontSize = 0.0;
};

constexpr double kPinRadiusFactor = 0.015;
constexpr double kPinGlowScale = 1.5;
constexpr float kPinGlowAlpha = 0.2f;
constexpr double kPinRingFactor = 0.2;

PinAppearance ComputePinAppearance(Priority priority, int targetWidth,
                                   int targetHeight,
                                   const PriorityPalette &palette);

class IRasterSurface;

// Draws glow, disc, ring and label in that order at the given pixel
// position.
void DrawPin(IRasterSurface &target, const PixelPoint &position,
             const std::string &label, Priority priority,
             const PriorityPalette &palette);
