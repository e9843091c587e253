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

#include <string>

#include "../models/inspectionsnapshot.h"

// Reads the record store's JSON export of one project:
//   { "info": {...}, "plans": [...], "obs": [...], "weather": {...} }
// Image payloads are base64 data URLs and are decoded to raw bytes. A payload
// that is not valid base64 is kept as an empty payload so the failure shows
// up later as an undecodable asset rather than a load error.
bool LoadInspectionSnapshot(const std::string& path, InspectionSnapshot& snapshot,
                            std::string& error);
bool ParseInspectionSnapshot(const std::string& json, InspectionSnapshot& snapshot,
                             std::string& error);

// Strips an optional "data:<mime>;base64," prefix and decodes the rest.
// Returns an empty string on malformed input.
std::string DecodeImagePayload(const std::string& dataUrl);
