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
#include <vector>

#include "../core/reportconfig.h"
#include "../models/inspectionsnapshot.h"
#include "../render/rastersurface.h"
#include "layoutengine.h"
#include "reportcanvas.h"

// Generation phases in the only order they may run.
enum class ReportPhase { Cover, Maps, Details, Finalize };

const char *ReportPhaseName(ReportPhase phase);

// An asset left out of the document because it could not be decoded or
// encoded. ownerId is the plan id for plans and the observation id for
// photos.
struct SkippedItem {
  enum class Kind { Plan, Photo };
  Kind kind = Kind::Plan;
  std::string ownerId;
  std::string reason;
};

struct AssemblyReport {
  size_t mapPages = 0;
  size_t findingBlocks = 0;
  size_t photosPlaced = 0;
  size_t oversizedBlocks = 0;
  std::vector<SkippedItem> skipped;
};

// Draws the complete report for one snapshot onto a report canvas: cover
// and summary, one map page per plan with findings, then the detailed
// findings. Decode failures, thrown or returned, skip the affected plan or
// photo and are recorded in the returned report. Serializing and saving the
// canvas is the caller's job.
class DocumentAssembler {
public:
  DocumentAssembler(const IRasterBackend &backend, const ReportStyle &style);

  AssemblyReport Assemble(const InspectionSnapshot &snapshot,
                          int64_t generatedAtSeconds, IReportCanvas &canvas);

  ReportPhase Phase() const { return phase_; }

private:
  void EnterPhase(ReportPhase next);

  // Returns the y position where the summary table starts.
  double RenderCover(const InspectionSnapshot &snapshot,
                     int64_t generatedAtSeconds, IReportCanvas &canvas);
  void RenderSummaryTable(const InspectionSnapshot &snapshot,
                            const FindingNumbering &numbering, double top,
                            IReportCanvas &canvas);
  void RenderMaps(const InspectionSnapshot &snapshot,
                  const FindingNumbering &numbering, IReportCanvas &canvas,
                  AssemblyReport &report);
  void RenderDetails(const InspectionSnapshot &snapshot,
                     const FindingNumbering &numbering, IReportCanvas &canvas,
                     AssemblyReport &report);
  void DrawFindingBlock(const InspectionSnapshot &snapshot,
                        const Observation &observation, int number,
                        const FindingBlockLayout &layout,
                        const std::vector<EncodedImage> &photos, double top,
                        IReportCanvas &canvas);
  std::vector<EncodedImage> TranscodePhotos(const Observation &observation,
                                            AssemblyReport &report) const;

  const IRasterBackend &backend_;
  ReportStyle style_;
  ReportPhase phase_ = ReportPhase::Cover;
};

// Formatting used on the cover and in the summary table. Times are UTC.
std::string FormatGeneratedAt(int64_t epochSeconds);
std::string FormatFindingDate(int64_t epochMillis);
std::string FormatWeatherLine(const WeatherSnapshot &weather);

// Shortens text with a trailing "..." until it fits the width.
std::string FitTextToWidth(const ITextMeasurer &measurer,
                           const std::string &text, double width,
                           double fontSize, bool bold);
