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
#include "../render/plancompositor.h"
#include "testfakes.h"

#include <iostream>

namespace {

Observation MakeObservation(const std::string &id, Priority priority,
                            const char *planId,
                            std::optional<Coordinates> coords) {
  Observation obs;
  obs.id = id;
  obs.priority = priority;
  if (planId)
    obs.planId = std::string(planId);
  obs.coords = coords;
  return obs;
}

} // namespace

int main() {
  std::vector<Observation> observations;
  observations.push_back(MakeObservation("a", Priority::High, "p1", Coordinates{10, 20}));
  observations.push_back(MakeObservation("b", Priority::Low, "p1", std::nullopt));
  observations.push_back(MakeObservation("c", Priority::Critical, "p2", Coordinates{50, 50}));
  observations.push_back(MakeObservation("d", Priority::Medium, "p1", Coordinates{90, 80}));
  FindingNumbering numbering = FindingNumbering::FromCanonicalOrder(observations);

  FloorPlan plan{"p1", "Level 1", "RASTER 1000 500"};
  std::vector<const Observation *> all;
  for (const Observation &obs : observations)
    all.push_back(&obs);

  // Unlocated findings and findings on other plans get no pin
  std::vector<PlanPin> pins = CollectPlanPins(plan, all, numbering);
  if (pins.size() != 2 || pins[0].label != "1" || pins[1].label != "4") {
    std::cerr << "Unexpected pins collected for plan" << std::endl;
    return 1;
  }

  FakeRasterBackend backend;
  PlanCompositeOptions options;
  CompositeResult first = CompositePlan(backend, plan, pins, options);
  CompositeResult second = CompositePlan(backend, plan, pins, options);
  if (!first.success || first.pinCount != 2) {
    std::cerr << "Compositing failed: " << first.message << std::endl;
    return 1;
  }
  if (first.image.data != second.image.data) {
    std::cerr << "Compositing is not deterministic" << std::endl;
    return 1;
  }
  if (first.image.width != 1000 || first.image.height != 500) {
    std::cerr << "Composite was resized" << std::endl;
    return 1;
  }
  if (first.image.data.find(" q85") == std::string::npos) {
    std::cerr << "Composite not encoded at quality 85" << std::endl;
    return 1;
  }
  if (plan.imageData != "RASTER 1000 500") {
    std::cerr << "Source plan was modified" << std::endl;
    return 1;
  }

  // Pin positions land on the native raster
  FakeRasterSurface surface(1000, 500);
  CompositeResult direct = CompositeDecodedPlan(surface, pins, options);
  if (!direct.success || surface.ops.size() != 8 || surface.ops[0].x != 100.0 ||
      surface.ops[0].y != 100.0 || surface.ops[4].x != 900.0 ||
      surface.ops[4].y != 400.0) {
    std::cerr << "Pins drawn at unexpected positions" << std::endl;
    return 1;
  }

  // A plan that cannot be decoded fails alone, with a reason
  FloorPlan broken{"p9", "Roof", "not an image"};
  CompositeResult failed = CompositePlan(backend, broken, pins, options);
  if (failed.success || failed.message.empty() || failed.image.IsValid()) {
    std::cerr << "Decode failure not reported" << std::endl;
    return 1;
  }

  FloorPlan noEncode{"p1", "Level 1", "RASTER 100 100 NOENCODE"};
  CompositeResult encodeFailed = CompositePlan(backend, noEncode, pins, options);
  if (encodeFailed.success) {
    std::cerr << "Encode failure not reported" << std::endl;
    return 1;
  }

  // Empty pin list still produces the flattened base image
  CompositeResult bare = CompositePlan(backend, plan, {}, options);
  if (!bare.success || bare.pinCount != 0) {
    std::cerr << "Plan without pins failed" << std::endl;
    return 1;
  }
  return 0;
}
