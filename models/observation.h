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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "types.h"

// A single inspection finding as stored by the record store
struct Observation {
    std::string id;
    std::string note;
    Priority priority = Priority::Medium;

    std::optional<std::string> planId;    // Plan the finding is pinned to
    std::optional<Coordinates> coords;    // Normalized pin position on that plan

    std::vector<std::string> images;      // Encoded photo payloads (JPEG/PNG bytes)
    std::vector<std::string> tags;

    std::string trade;
    std::string responsibleParty;
    std::string recommendedAction;

    int64_t timestamp = 0;                // Creation time, epoch milliseconds

    // A pin is only drawn when both the plan reference and the coordinates
    // are present.
    bool HasPin() const { return planId.has_value() && coords.has_value(); }
    bool IsOnPlan(const std::string& id) const { return planId && *planId == id; }
};
