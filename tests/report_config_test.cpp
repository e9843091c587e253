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
#include "../core/reportconfig.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace {
bool Near(double a, double b) { return std::abs(a - b) < 1e-6; }
} // namespace

int main() {
  ReportStyle defaults;
  std::string error;
  assert(ValidateReportStyle(defaults, error));
  assert(defaults.perRow == 3);
  assert(defaults.jpegQuality == 85);
  assert(std::abs(defaults.PageWidth() - 595.28) < 0.01);
  assert(std::abs(defaults.PageHeight() - 841.89) < 0.01);
  assert(Near(defaults.ContentBottom(), defaults.PageHeight() - defaults.marginPt));

  // The palette is usable from the configuration layer alone
  const CanvasColor &critical = defaults.priorityColors.ColorFor(Priority::Critical);
  assert(Near(critical.r, 0xdc / 255.0) && Near(critical.g, 0x26 / 255.0));
  assert(&defaults.priorityColors.ColorFor(Priority::Low) ==
         &defaults.priorityColors.ColorFor(Priority::Medium));

  const auto dir = std::filesystem::temp_directory_path();
  const auto path = (dir / "inspectra_style_test.json").string();
  {
    std::ofstream out(path);
    out << R"({"page_size": "Letter", "landscape": true, "margin_pt": 36,
               "per_row": 4, "cell_size_pt": 100, "jpeg_quality": 70,
               "parallel_decode": false})";
  }
  ReportStyle style;
  assert(LoadReportStyle(path, style, error));
  assert(style.page.pageSize == print::PageSize::Letter);
  assert(style.page.landscape);
  assert(style.PageWidth() > style.PageHeight());
  assert(Near(style.marginPt, 36.0));
  assert(style.perRow == 4);
  assert(style.jpegQuality == 70);
  assert(!style.parallelDecode);
  // Untouched keys keep their defaults
  assert(Near(style.lineHeightPt, defaults.lineHeightPt));

  // Saved styles load back unchanged
  const auto savedPath = (dir / "inspectra_style_saved.json").string();
  assert(SaveReportStyle(savedPath, style, error));
  ReportStyle reloaded;
  assert(LoadReportStyle(savedPath, reloaded, error));
  assert(reloaded.page.pageSize == print::PageSize::Letter);
  assert(reloaded.perRow == 4);
  assert(Near(reloaded.cellSizePt, 100.0));

  // A grid wider than the page is rejected and the style is kept
  {
    std::ofstream out(path);
    out << R"({"per_row": 6})";
  }
  ReportStyle kept;
  error.clear();
  assert(!LoadReportStyle(path, kept, error));
  assert(!error.empty());
  assert(kept.perRow == 3);

  // Captions need the gap below each cell
  ReportStyle tight;
  tight.cellSpacingPt = tight.captionFontSize + 1.0;
  error.clear();
  assert(!ValidateReportStyle(tight, error));
  assert(error.find("caption") != std::string::npos);
  tight.cellSpacingPt = tight.captionFontSize + 2.0;
  assert(ValidateReportStyle(tight, error));

  for (double ReportStyle::*field :
       {&ReportStyle::tableRowHeightPt, &ReportStyle::metadataLineHeightPt,
        &ReportStyle::mapMaxHeightPt}) {
    ReportStyle bad;
    bad.*field = 0.0;
    assert(!ValidateReportStyle(bad, error));
    bad.*field = -4.0;
    assert(!ValidateReportStyle(bad, error));
  }
  {
    std::ofstream out(path);
    out << R"({"cell_spacing_pt": 4})";
  }
  assert(!LoadReportStyle(path, kept, error));
  assert(Near(kept.cellSpacingPt, defaults.cellSpacingPt));

  {
    std::ofstream out(path);
    out << R"({"page_size": "Tabloid"})";
  }
  assert(!LoadReportStyle(path, kept, error));
  {
    std::ofstream out(path);
    out << R"({"margin_pt": "wide"})";
  }
  assert(!LoadReportStyle(path, kept, error));
  assert(!LoadReportStyle((dir / "missing_inspectra_style.json").string(), kept, error));

  std::filesystem::remove(path);
  std::filesystem::remove(savedPath);
  return 0;
}
