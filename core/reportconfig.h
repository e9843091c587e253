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

#include "../render/canvastypes.h"
#include "print/PageSetup.h"

// Every styling value used by the report engine. Units are PDF points
// unless noted otherwise. Defaults reproduce the A4 report layout.
struct ReportStyle {
    print::PageSetup page;

    double marginPt = 56.69;          // 20 mm on every side
    double lineHeightPt = 14.17;      // Wrapped paragraph line height
    double cellSizePt = 141.73;       // Square photo cell
    double cellSpacingPt = 17.0;      // Gap after each cell, holds the caption
    int perRow = 3;                   // Photo cells per grid row

    // Fixed severity encoding, not configurable from files
    PriorityPalette priorityColors;

    double titleFontSize = 22.0;
    double sectionFontSize = 16.0;
    double headingFontSize = 12.0;
    double bodyFontSize = 10.0;
    double metaFontSize = 9.0;
    double captionFontSize = 8.0;

    double blockHeaderHeightPt = 34.0;    // Separator rule plus "Finding #N" line
    double metadataLineHeightPt = 16.0;
    double blockSpacingPt = 14.17;
    double tableRowHeightPt = 16.0;
    double mapMaxHeightPt = 623.6;        // 220 mm

    int jpegQuality = 85;
    bool parallelDecode = true;

    double PageWidth() const { return page.PageWidthPt(); }
    double PageHeight() const { return page.PageHeightPt(); }
    double ContentWidth() const { return PageWidth() - 2.0 * marginPt; }
    double ContentBottom() const { return PageHeight() - marginPt; }
};

// Overlays values found in a JSON file onto style. Keys that are absent keep
// their current value. Returns false and fills error when the file cannot be
// read or yields an unusable layout; style is left untouched in that case.
bool LoadReportStyle(const std::string& path, ReportStyle& style, std::string& error);
bool SaveReportStyle(const std::string& path, const ReportStyle& style, std::string& error);

// Checks that the style leaves room for content and for one grid row.
bool ValidateReportStyle(const ReportStyle& style, std::string& error);
