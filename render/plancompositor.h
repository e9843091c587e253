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
#include <vector>

#include "../models/floorplan.h"
#include "../models/inspectionsnapshot.h"
#include "canvastypes.h"
#include "pinrenderer.h"
#include "rastersurface.h"

// One marker to overlay on a plan
struct PlanPin {
  std::string label;
  Priority priority = Priority::Medium;
  Coordinates coords;
};

struct PlanCompositeOptions {
  PriorityPalette palette;
  int jpegQuality = 85;
};

struct CompositeResult {
  bool success = false;
  EncodedImage image;
  size_t pinCount = 0;
  std::string message;
};

// Builds the pins for a plan from its findings. Findings without coordinates,
// or referencing another plan, produce no pin.
std::vector<PlanPin> CollectPlanPins(
    const FloorPlan &plan, const std::vector<const Observation *> &observations,
    const FindingNumbering &numbering);

// Draws the pins over an already decoded plan and encodes the flattened
// result. The surface is the compositing target and is modified in place.
CompositeResult CompositeDecodedPlan(IRasterSurface &surface,
                                     const std::vector<PlanPin> &pins,
                                     const PlanCompositeOptions &options);

// Decodes the plan at its native resolution and composites its pins. A plan
// that fails to decode yields an unsuccessful result; nothing is thrown.
CompositeResult CompositePlan(const IRasterBackend &backend,
                              const FloorPlan &plan,
                              const std::vector<PlanPin> &pins,
                              const PlanCompositeOptions &options);
