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
#include <string>

// Severity assigned to a finding. The ordinal order is significant: Critical
// is the most severe value.
enum class Priority {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

// Pin location expressed as a percentage of the plan image width and height.
// Both axes are in [0,100] regardless of the plan's pixel dimensions.
struct Coordinates {
    double x = 0.0;
    double y = 0.0;
};

const char* PriorityName(Priority priority);
std::string PriorityLabelUpper(Priority priority);
std::optional<Priority> ParsePriority(const std::string& text);
