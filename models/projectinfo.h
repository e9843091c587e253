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
#include <string>

struct ProjectInfo {
    std::string id;
    std::string name;
    std::string location;
    std::string inspector;
    std::string emailTo;
    int64_t lastModified = 0;    // Epoch milliseconds
};

// Current conditions captured on site. Imperial units as shown in the app.
struct WeatherSnapshot {
    double temp = 0.0;           // Fahrenheit
    std::string condition;
    double humidity = 0.0;       // Percent
    double wind = 0.0;           // mph
};
