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
#include "inspectionsnapshot.h"

const FloorPlan* InspectionSnapshot::FindPlan(const std::string& id) const
{
    for (const auto& plan : plans) {
        if (plan.id == id)
            return &plan;
    }
    return nullptr;
}

std::vector<const Observation*> InspectionSnapshot::ObservationsForPlan(const std::string& planId) const
{
    std::vector<const Observation*> result;
    for (const auto& obs : observations) {
        if (obs.IsOnPlan(planId))
            result.push_back(&obs);
    }
    return result;
}

std::array<size_t, 4> InspectionSnapshot::CountByPriority() const
{
    std::array<size_t, 4> counts{};
    for (const auto& obs : observations)
        ++counts[static_cast<size_t>(obs.priority)];
    return counts;
}

FindingNumbering FindingNumbering::FromCanonicalOrder(const std::vector<Observation>& observations)
{
    FindingNumbering numbering;
    numbering.numbers.reserve(observations.size());
    int next = 1;
    for (const auto& obs : observations) {
        if (numbering.numbers.emplace(obs.id, next).second)
            ++next;
    }
    return numbering;
}

int FindingNumbering::NumberOf(const std::string& observationId) const
{
    auto it = numbers.find(observationId);
    return it == numbers.end() ? 0 : it->second;
}
