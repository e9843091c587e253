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

#include "plancompositor.h"

#include "coordinatemapper.h"
#include "logger.h"

std::vector<PlanPin> CollectPlanPins(
    const FloorPlan &plan, const std::vector<const Observation *> &observations,
    const FindingNumbering &numbering) {
  std::vector<PlanPin> pins;
  pins.reserve(observations.size());
  for (const Observation *obs : observations) {
    if (!obs || !obs->HasPin() || !obs->IsOnPlan(plan.id))
      continue;
    PlanPin pin;
    pin.label = std::to_string(numbering.NumberOf(obs->id));
    pin.priority = obs->priority;
    pin.coords = *obs->coords;
    pins.push_back(std::move(pin));
  }
  return pins;
}

CompositeResult CompositeDecodedPlan(IRasterSurface &surface,
                                     const std::vector<PlanPin> &pins,
                                     const PlanCompositeOptions &options) {
  CompositeResult result;
  const double width = surface.Width();
  const double height = surface.Height();
  for (const auto &pin : pins) {
    DrawPin(surface, MapToPixels(pin.coords, width, height), pin.label,
            pin.priority, options.palette);
    ++result.pinCount;
  }

  std::string error;
  if (!surface.EncodeJpeg(options.jpegQuality, result.image, error)) {
    result.message = "Failed to encode composited plan: " + error;
    return result;
  }
  result.success = true;
  return result;
}

CompositeResult CompositePlan(const IRasterBackend &backend,
                              const FloorPlan &plan,
                              const std::vector<PlanPin> &pins,
                              const PlanCompositeOptions &options) {
  std::string error;
  std::unique_ptr<IRasterSurface> surface = backend.Decode(plan.imageData, error);
  if (!surface) {
    CompositeResult result;
    result.message = "Unable to decode plan '" + plan.name + "': " + error;
    Logger::Instance().Log(LogLevel::Warning, result.message);
    return result;
  }
  return CompositeDecodedPlan(*surface, pins, options);
}
