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

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "floorplan.h"
#include "observation.h"
#include "projectinfo.h"

// Read-only view of a project handed to the report engine for one run.
// Observations are kept in the project's canonical stored order.
struct InspectionSnapshot {
    ProjectInfo project;
    std::vector<FloorPlan> plans;
    std::vector<Observation> observations;
    std::optional<WeatherSnapshot> weather;

    const FloorPlan* FindPlan(const std::string& id) const;
    std::vector<const Observation*> ObservationsForPlan(const std::string& planId) const;
    std::array<size_t, 4> CountByPriority() const;
};

// Stable finding numbers assigned once per generation run from the canonical
// order. Numbers are dense and 1-based.
class FindingNumbering {
public:
    static FindingNumbering FromCanonicalOrder(const std::vector<Observation>& observations);

    // Returns 0 when the id is unknown.
    int NumberOf(const std::string& observationId) const;
    size_t Size() const { return numbers.size(); }

private:
    std::unordered_map<std::string, int> numbers;
};
