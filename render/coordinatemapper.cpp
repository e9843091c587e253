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

#include "coordinatemapper.h"

PixelPoint MapToPixels(const Coordinates &coords, double targetWidth,
                       double targetHeight) {
  return {coords.x / 100.0 * targetWidth, coords.y / 100.0 * targetHeight};
}

std::optional<PixelPoint> MapToPixels(const std::optional<Coordinates> &coords,
                                      double targetWidth, double targetHeight) {
  if (!coords)
    return std::nullopt;
  return MapToPixels(*coords, targetWidth, targetHeight);
}
