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
#include "reportconfig.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "logger.h"

namespace {

template <typename T>
void ReadOptional(const nlohmann::json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        out = it->template get<T>();
}

} // namespace

bool ValidateReportStyle(const ReportStyle& style, std::string& error)
{
    if (style.marginPt < 0.0 || style.ContentWidth() <= 0.0 ||
        style.ContentBottom() <= style.marginPt) {
        error = "Margins leave no printable area on the page.";
        return false;
    }
    if (style.perRow < 1) {
        error = "per_row must be at least 1.";
        return false;
    }
    if (style.cellSizePt <= 0.0 || style.cellSpacingPt < 0.0 || style.lineHeightPt <= 0.0) {
        error = "Cell size and line height must be positive.";
        return false;
    }
    if (style.tableRowHeightPt <= 0.0 || style.metadataLineHeightPt <= 0.0 ||
        style.mapMaxHeightPt <= 0.0) {
        error = "Table row height, metadata line height and map height must be positive.";
        return false;
    }
    // "Photo N" captions sit in the gap below each cell
    if (style.cellSpacingPt < style.captionFontSize + 2.0) {
        std::ostringstream msg;
        msg << "cell_spacing_pt (" << style.cellSpacingPt
            << " pt) leaves no room for photo captions; at least "
            << style.captionFontSize + 2.0 << " pt is required.";
        error = msg.str();
        return false;
    }
    const double gridWidth = style.perRow * style.cellSizePt +
                             (style.perRow - 1) * style.cellSpacingPt;
    if (gridWidth > style.ContentWidth()) {
        std::ostringstream msg;
        msg << "Photo grid (" << gridWidth << " pt) is wider than the content area ("
            << style.ContentWidth() << " pt).";
        error = msg.str();
        return false;
    }
    if (style.jpegQuality < 1 || style.jpegQuality > 100) {
        error = "jpeg_quality must be between 1 and 100.";
        return false;
    }
    return true;
}

bool LoadReportStyle(const std::string& path, ReportStyle& style, std::string& error)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "Unable to open style file: " + path;
        return false;
    }

    ReportStyle loaded = style;
    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            error = "Style file must contain a JSON object.";
            return false;
        }

        std::string pageSize;
        ReadOptional(j, "page_size", pageSize);
        if (!pageSize.empty()) {
            auto parsed = print::ParsePageSize(pageSize);
            if (!parsed) {
                error = "Unknown page_size '" + pageSize + "'.";
                return false;
            }
            loaded.page.pageSize = *parsed;
        }
        ReadOptional(j, "landscape", loaded.page.landscape);

        ReadOptional(j, "margin_pt", loaded.marginPt);
        ReadOptional(j, "line_height_pt", loaded.lineHeightPt);
        ReadOptional(j, "cell_size_pt", loaded.cellSizePt);
        ReadOptional(j, "cell_spacing_pt", loaded.cellSpacingPt);
        ReadOptional(j, "per_row", loaded.perRow);

        ReadOptional(j, "title_font_size", loaded.titleFontSize);
        ReadOptional(j, "section_font_size", loaded.sectionFontSize);
        ReadOptional(j, "heading_font_size", loaded.headingFontSize);
        ReadOptional(j, "body_font_size", loaded.bodyFontSize);
        ReadOptional(j, "meta_font_size", loaded.metaFontSize);
        ReadOptional(j, "caption_font_size", loaded.captionFontSize);

        ReadOptional(j, "block_header_height_pt", loaded.blockHeaderHeightPt);
        ReadOptional(j, "metadata_line_height_pt", loaded.metadataLineHeightPt);
        ReadOptional(j, "block_spacing_pt", loaded.blockSpacingPt);
        ReadOptional(j, "table_row_height_pt", loaded.tableRowHeightPt);
        ReadOptional(j, "map_max_height_pt", loaded.mapMaxHeightPt);

        ReadOptional(j, "jpeg_quality", loaded.jpegQuality);
        ReadOptional(j, "parallel_decode", loaded.parallelDecode);
    } catch (const nlohmann::json::exception& ex) {
        error = std::string("Invalid style file: ") + ex.what();
        return false;
    }

    if (!ValidateReportStyle(loaded, error))
        return false;

    style = loaded;
    Logger::Instance().Log("Loaded report style from " + path);
    return true;
}

bool SaveReportStyle(const std::string& path, const ReportStyle& style, std::string& error)
{
    nlohmann::json j;
    j["page_size"] = print::PageSizeName(style.page.pageSize);
    j["landscape"] = style.page.landscape;
    j["margin_pt"] = style.marginPt;
    j["line_height_pt"] = style.lineHeightPt;
    j["cell_size_pt"] = style.cellSizePt;
    j["cell_spacing_pt"] = style.cellSpacingPt;
    j["per_row"] = style.perRow;
    j["title_font_size"] = style.titleFontSize;
    j["section_font_size"] = style.sectionFontSize;
    j["heading_font_size"] = style.headingFontSize;
    j["body_font_size"] = style.bodyFontSize;
    j["meta_font_size"] = style.metaFontSize;
    j["caption_font_size"] = style.captionFontSize;
    j["block_header_height_pt"] = style.blockHeaderHeightPt;
    j["metadata_line_height_pt"] = style.metadataLineHeightPt;
    j["block_spacing_pt"] = style.blockSpacingPt;
    j["table_row_height_pt"] = style.tableRowHeightPt;
    j["map_max_height_pt"] = style.mapMaxHeightPt;
    j["jpeg_quality"] = style.jpegQuality;
    j["parallel_decode"] = style.parallelDecode;

    std::ofstream out(path);
    if (!out.is_open()) {
        error = "Unable to write style file: " + path;
        return false;
    }
    out << j.dump(4);
    if (!out.good()) {
        error = "Failed while writing style file: " + path;
        return false;
    }
    return true;
}
