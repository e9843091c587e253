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

#include <optional>

#include "../models/types.h"

struct PixelPoint {
  double x = 0.0;
  double y = 0.0;
};

// Converts a normalized pin position into absolute pixels for a raster of
// the given size. Absent coordinates produce no point; callers treat such
// findings as not located rather than as an error.
std::optional<PixelPoint> MapToPixels(const std::optional<Coordinates> &coords,
                                      double targetWidth, double targetHeight);

PixelPoint MapToPixels(const Coordinates &coords, double targetWidth,
                       double targetHeight);
