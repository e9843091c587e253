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
#include "snapshotloader.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <wx/base64.h>

#include "logger.h"

namespace {

std::string StringField(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

int64_t IntField(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return 0;
    // Values outside the int64 range (or NaN) read as absent
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (!(value >= -9223372036854775808.0 && value < 9223372036854775808.0))
            return 0;
        return static_cast<int64_t>(value);
    }
    if (it->is_number_unsigned()) {
        const uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return 0;
        return static_cast<int64_t>(value);
    }
    return it->get<int64_t>();
}

double NumberField(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return 0.0;
    return it->get<double>();
}

double ClampPercent(double value, const std::string& obsId, const char* axis)
{
    if (value >= 0.0 && value <= 100.0)
        return value;
    Logger::Instance().Log(LogLevel::Warning,
                           "Observation " + obsId + ": " + axis +
                               " coordinate out of range, clamped");
    return std::clamp(value, 0.0, 100.0);
}

bool ParseObservation(const nlohmann::json& j, Observation& obs, std::string& error)
{
    obs.id = StringField(j, "id");
    if (obs.id.empty()) {
        error = "Observation without id.";
        return false;
    }
    obs.note = StringField(j, "note");

    const std::string priority = StringField(j, "priority");
    auto parsed = ParsePriority(priority);
    if (!parsed) {
        error = "Observation " + obs.id + " has invalid priority '" + priority + "'.";
        return false;
    }
    obs.priority = *parsed;

    const std::string planId = StringField(j, "planId");
    if (!planId.empty())
        obs.planId = planId;

    auto coords = j.find("coords");
    if (coords != j.end() && coords->is_object()) {
        Coordinates c;
        c.x = ClampPercent(NumberField(*coords, "x"), obs.id, "x");
        c.y = ClampPercent(NumberField(*coords, "y"), obs.id, "y");
        obs.coords = c;
    }

    auto images = j.find("images");
    if (images != j.end() && images->is_array()) {
        for (const auto& image : *images) {
            if (image.is_string())
                obs.images.push_back(DecodeImagePayload(image.get<std::string>()));
        }
    }
    auto tags = j.find("tags");
    if (tags != j.end() && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (tag.is_string())
                obs.tags.push_back(tag.get<std::string>());
        }
    }

    obs.trade = StringField(j, "trade");
    obs.responsibleParty = StringField(j, "responsibleParty");
    obs.recommendedAction = StringField(j, "recommendedAction");
    obs.timestamp = IntField(j, "timestamp");
    return true;
}

} // namespace

std::string DecodeImagePayload(const std::string& dataUrl)
{
    std::string encoded = dataUrl;
    if (encoded.rfind("data:", 0) == 0) {
        const size_t comma = encoded.find(',');
        if (comma == std::string::npos)
            return {};
        encoded.erase(0, comma + 1);
    }
    encoded.erase(std::remove_if(encoded.begin(), encoded.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; }),
                  encoded.end());
    if (encoded.empty())
        return {};

    size_t errorPos = 0;
    wxMemoryBuffer buffer = wxBase64Decode(encoded.data(), encoded.size(),
                                           wxBase64DecodeMode_Strict, &errorPos);
    if (buffer.IsEmpty())
        return {};
    return std::string(static_cast<const char*>(buffer.GetData()), buffer.GetDataLen());
}

bool ParseInspectionSnapshot(const std::string& json, InspectionSnapshot& snapshot,
                             std::string& error)
{
    InspectionSnapshot parsed;
    try {
        const nlohmann::json root = nlohmann::json::parse(json);
        if (!root.is_object()) {
            error = "Snapshot must be a JSON object.";
            return false;
        }

        auto info = root.find("info");
        if (info == root.end() || !info->is_object()) {
            error = "Snapshot is missing project info.";
            return false;
        }
        parsed.project.id = StringField(*info, "id");
        parsed.project.name = StringField(*info, "name");
        parsed.project.location = StringField(*info, "location");
        parsed.project.inspector = StringField(*info, "inspector");
        parsed.project.emailTo = StringField(*info, "emailTo");
        parsed.project.lastModified = IntField(*info, "lastModified");

        auto plans = root.find("plans");
        if (plans != root.end() && plans->is_array()) {
            for (const auto& p : *plans) {
                FloorPlan plan;
                plan.id = StringField(p, "id");
                plan.name = StringField(p, "name");
                plan.imageData = DecodeImagePayload(StringField(p, "imageData"));
                if (plan.imageData.empty())
                    Logger::Instance().Log(LogLevel::Warning,
                                           "Plan '" + plan.name + "' has no decodable payload");
                parsed.plans.push_back(std::move(plan));
            }
        }

        std::unordered_set<std::string> seen;
        auto obs = root.find("obs");
        if (obs != root.end() && obs->is_array()) {
            for (const auto& o : *obs) {
                Observation observation;
                if (!ParseObservation(o, observation, error))
                    return false;
                if (!seen.insert(observation.id).second) {
                    error = "Duplicate observation id " + observation.id + ".";
                    return false;
                }
                parsed.observations.push_back(std::move(observation));
            }
        }

        auto weather = root.find("weather");
        if (weather != root.end() && weather->is_object()) {
            WeatherSnapshot w;
            w.temp = NumberField(*weather, "temp");
            w.condition = StringField(*weather, "condition");
            w.humidity = NumberField(*weather, "humidity");
            w.wind = NumberField(*weather, "wind");
            parsed.weather = w;
        }
    } catch (const nlohmann::json::exception& ex) {
        error = std::string("Invalid snapshot JSON: ") + ex.what();
        return false;
    }

    snapshot = std::move(parsed);
    return true;
}

bool LoadInspectionSnapshot(const std::string& path, InspectionSnapshot& snapshot,
                            std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "Unable to open snapshot: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!ParseInspectionSnapshot(buffer.str(), snapshot, error))
        return false;

    std::ostringstream msg;
    msg << "Loaded snapshot '" << snapshot.project.name << "' with "
        << snapshot.plans.size() << " plan(s) and "
        << snapshot.observations.size() << " observation(s)";
    Logger::Instance().Log(msg.str());
    return true;
}
