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
#include "types.h"

#include <algorithm>
#include <cctype>

const char* PriorityName(Priority priority)
{
    switch (priority) {
    case Priority::Low: return "Low";
    case Priority::Medium: return "Medium";
    case Priority::High: return "High";
    case Priority::Critical: return "Critical";
    }
    return "Medium";
}

std::string PriorityLabelUpper(Priority priority)
{
    std::string label = PriorityName(priority);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return label;
}

std::optional<Priority> ParsePriority(const std::string& text)
{
    if (text == "Low")
        return Priority::Low;
    if (text == "Medium")
        return Priority::Medium;
    if (text == "High")
        return Priority::High;
    if (text == "Critical")
        return Priority::Critical;
    return std::nullopt;
}
