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

#include "documentassembler.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <future>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "../render/plancompositor.h"
#include "logger.h"
#include "stringutils.h"

namespace {

constexpr double kMmPt = 72.0 / 25.4;
constexpr size_t kSummaryDescriptionChars = 50;
constexpr size_t kPlanDecodesInFlight = 3;

const CanvasColor kTitleColor = CanvasColor::FromRgb(0x212121);
const CanvasColor kBlack = CanvasColor::FromRgb(0x000000);
const CanvasColor kMutedText = CanvasColor::FromRgb(0x646464);
const CanvasColor kCaptionText = CanvasColor::FromRgb(0x969696);
const CanvasColor kRuleColor = CanvasColor::FromRgb(0xc8c8c8);
const CanvasColor kBlockRuleColor = CanvasColor::FromRgb(0xe6e6e6);
const CanvasColor kTableHeaderFill = CanvasColor::FromRgb(0x2563eb);
const CanvasColor kTableStripeFill = CanvasColor::FromRgb(0xf5f5f5);
const CanvasColor kWhite = CanvasColor::FromRgb(0xffffff);

CanvasTextStyle TextStyle(double size, bool bold, const CanvasColor &color,
                          CanvasTextStyle::HorizontalAlign align =
                              CanvasTextStyle::HorizontalAlign::Left) {
  CanvasTextStyle style;
  style.fontSize = static_cast<float>(size);
  style.bold = bold;
  style.color = color;
  style.hAlign = align;
  return style;
}

std::tm UtcTime(std::time_t t) {
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif
  return utc;
}

std::string FormatNumber(double value) {
  std::ostringstream ss;
  double rounded = std::round(value * 10.0) / 10.0;
  if (std::abs(rounded - std::round(rounded)) < 1e-9)
    ss << static_cast<long long>(std::llround(rounded));
  else
    ss << std::fixed << std::setprecision(1) << rounded;
  return ss.str();
}

std::string OrDefault(const std::string &value, const char *fallback) {
  return value.empty() ? std::string(fallback) : value;
}

void PopLastCodePoint(std::string &s) {
  while (!s.empty()) {
    unsigned char last = static_cast<unsigned char>(s.back());
    s.pop_back();
    if ((last & 0xC0) != 0x80)
      break;
  }
}

struct SummaryColumn {
  const char *title;
  double fraction;
};

constexpr SummaryColumn kSummaryColumns[] = {
    {"#", 0.06},     {"Date", 0.14},        {"Priority", 0.12},
    {"Trade", 0.14}, {"Description", 0.36}, {"Responsible", 0.18}};
constexpr size_t kSummaryColumnCount =
    sizeof(kSummaryColumns) / sizeof(kSummaryColumns[0]);

struct PlanDecode {
  std::unique_ptr<IRasterSurface> surface;
  std::string error;
};

struct PendingPlan {
  const FloorPlan *plan = nullptr;
  std::vector<PlanPin> pins;
  std::future<PlanDecode> decode;
};

} // namespace

const char *ReportPhaseName(ReportPhase phase) {
  switch (phase) {
  case ReportPhase::Cover:
    return "Cover";
  case ReportPhase::Maps:
    return "Maps";
  case ReportPhase::Details:
    return "Details";
  case ReportPhase::Finalize:
    return "Finalize";
  }
  return "Unknown";
}

std::string FormatGeneratedAt(int64_t epochSeconds) {
  std::tm utc = UtcTime(static_cast<std::time_t>(epochSeconds));
  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%d %H:%M") << " UTC";
  return ss.str();
}

std::string FormatFindingDate(int64_t epochMillis) {
  std::tm utc = UtcTime(static_cast<std::time_t>(epochMillis / 1000));
  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%d");
  return ss.str();
}

std::string FormatWeatherLine(const WeatherSnapshot &weather) {
  return "Weather: " + FormatNumber(weather.temp) + "\xC2\xB0" + "F, " +
         weather.condition + ", Humidity " + FormatNumber(weather.humidity) +
         "%, Wind " + FormatNumber(weather.wind) + " mph";
}

std::string FitTextToWidth(const ITextMeasurer &measurer,
                           const std::string &text, double width,
                           double fontSize, bool bold) {
  if (measurer.MeasureText(text, fontSize, bold) <= width)
    return text;
  std::string cut = text;
  while (!cut.empty()) {
    PopLastCodePoint(cut);
    std::string candidate = cut + "...";
    if (measurer.MeasureText(candidate, fontSize, bold) <= width)
      return candidate;
  }
  return std::string();
}

DocumentAssembler::DocumentAssembler(const IRasterBackend &backend,
                                     const ReportStyle &style)
    : backend_(backend), style_(style) {}

void DocumentAssembler::EnterPhase(ReportPhase next) {
  if (static_cast<int>(next) < static_cast<int>(phase_))
    throw std::logic_error(std::string("Report phase ") +
                           ReportPhaseName(next) + " requested after " +
                           ReportPhaseName(phase_));
  phase_ = next;
  Logger::Instance().Log(std::string("Report phase: ") + ReportPhaseName(next));
}

AssemblyReport DocumentAssembler::Assemble(const InspectionSnapshot &snapshot,
                                           int64_t generatedAtSeconds,
                                           IReportCanvas &canvas) {
  phase_ = ReportPhase::Cover;
  AssemblyReport report;
  FindingNumbering numbering =
      FindingNumbering::FromCanonicalOrder(snapshot.observations);

  EnterPhase(ReportPhase::Cover);
  double tableTop = RenderCover(snapshot, generatedAtSeconds, canvas);
  RenderSummaryTable(snapshot, numbering, tableTop, canvas);

  EnterPhase(ReportPhase::Maps);
  RenderMaps(snapshot, numbering, canvas, report);

  EnterPhase(ReportPhase::Details);
  RenderDetails(snapshot, numbering, canvas, report);

  EnterPhase(ReportPhase::Finalize);
  return report;
}

double DocumentAssembler::RenderCover(const InspectionSnapshot &snapshot,
                                      int64_t generatedAtSeconds,
                                      IReportCanvas &canvas) {
  using Align = CanvasTextStyle::HorizontalAlign;
  canvas.BeginPage();
  const double left = style_.marginPt;
  const double right = canvas.PageWidth() - style_.marginPt;
  const double centerX = canvas.PageWidth() / 2.0;

  double y = style_.marginPt;
  canvas.DrawText(centerX, y, "SITE INSPECTION REPORT",
                  TextStyle(style_.titleFontSize, true, kTitleColor,
                            Align::Center));
  y += 8.0 * kMmPt;
  canvas.DrawText(centerX, y,
                  "Generated on: " + FormatGeneratedAt(generatedAtSeconds),
                  TextStyle(style_.bodyFontSize, false, kMutedText,
                            Align::Center));
  y += 7.0 * kMmPt;
  canvas.DrawLine(left, y, right, y, CanvasStroke{kRuleColor, 0.5f});
  y += 10.0 * kMmPt;

  canvas.DrawText(left, y, "PROJECT DETAILS",
                  TextStyle(style_.headingFontSize, true, kBlack));
  y += 7.0 * kMmPt;

  const ProjectInfo &project = snapshot.project;
  const auto counts = snapshot.CountByPriority();
  std::vector<std::string> lines = {
      "Project Name: " + project.name,
      "Location: " + project.location,
      "Inspector: " + project.inspector,
      "Total Findings: " + std::to_string(snapshot.observations.size()),
      "By Priority: Critical " +
          std::to_string(counts[static_cast<size_t>(Priority::Critical)]) +
          ", High " +
          std::to_string(counts[static_cast<size_t>(Priority::High)]) +
          ", Medium " +
          std::to_string(counts[static_cast<size_t>(Priority::Medium)]) +
          ", Low " + std::to_string(counts[static_cast<size_t>(Priority::Low)])};
  if (snapshot.weather)
    lines.push_back(FormatWeatherLine(*snapshot.weather));

  const CanvasTextStyle body = TextStyle(style_.bodyFontSize, false, kBlack);
  for (const std::string &line : lines) {
    canvas.DrawText(left, y, FitTextToWidth(canvas, line, style_.ContentWidth(),
                                            style_.bodyFontSize, false),
                    body);
    y += 6.0 * kMmPt;
  }
  return y + 4.0 * kMmPt;
}

void DocumentAssembler::RenderSummaryTable(const InspectionSnapshot &snapshot,
                                           const FindingNumbering &numbering,
                                           double top, IReportCanvas &canvas) {
  const double left = style_.marginPt;
  const double width = style_.ContentWidth();
  const double rowHeight = style_.tableRowHeightPt;
  const double bottom = style_.ContentBottom();
  const double padding = 3.0;
  const double baseline = rowHeight * 0.7;
  const double fontSize = style_.metaFontSize;

  double columnX[kSummaryColumnCount];
  double columnWidth[kSummaryColumnCount];
  double x = left;
  for (size_t c = 0; c < kSummaryColumnCount; ++c) {
    columnX[c] = x;
    columnWidth[c] = width * kSummaryColumns[c].fraction;
    x += columnWidth[c];
  }

  auto drawHeader = [&](double rowTop) {
    canvas.FillRect(left, rowTop, width, rowHeight, kTableHeaderFill);
    const CanvasTextStyle headerStyle = TextStyle(fontSize, true, kWhite);
    for (size_t c = 0; c < kSummaryColumnCount; ++c)
      canvas.DrawText(columnX[c] + padding, rowTop + baseline,
                      kSummaryColumns[c].title, headerStyle);
  };

  double y = top;
  if (y + 2.0 * rowHeight > bottom) {
    canvas.BeginPage();
    y = style_.marginPt;
  }
  drawHeader(y);
  y += rowHeight;

  const CanvasTextStyle cellStyle = TextStyle(fontSize, false, kBlack);
  size_t row = 0;
  for (const Observation &obs : snapshot.observations) {
    if (y + rowHeight > bottom) {
      canvas.BeginPage();
      y = style_.marginPt;
      drawHeader(y);
      y += rowHeight;
    }
    if (row % 2 == 1)
      canvas.FillRect(left, y, width, rowHeight, kTableStripeFill);

    std::string note = obs.note;
    std::replace(note.begin(), note.end(), '\n', ' ');
    const std::string cells[kSummaryColumnCount] = {
        std::to_string(numbering.NumberOf(obs.id)),
        FormatFindingDate(obs.timestamp),
        PriorityName(obs.priority),
        OrDefault(obs.trade, "N/A"),
        StringUtils::TruncateWithEllipsis(note, kSummaryDescriptionChars),
        OrDefault(obs.responsibleParty, "GC")};
    for (size_t c = 0; c < kSummaryColumnCount; ++c)
      canvas.DrawText(columnX[c] + padding, y + baseline,
                      FitTextToWidth(canvas, cells[c],
                                     columnWidth[c] - 2.0 * padding, fontSize,
                                     false),
                      cellStyle);
    y += rowHeight;
    ++row;
  }
}

void DocumentAssembler::RenderMaps(const InspectionSnapshot &snapshot,
                                   const FindingNumbering &numbering,
                                   IReportCanvas &canvas,
                                   AssemblyReport &report) {
  using Align = CanvasTextStyle::HorizontalAlign;
  PlanCompositeOptions options;
  options.palette = style_.priorityColors;
  options.jpegQuality = style_.jpegQuality;

  const std::launch policy =
      style_.parallelDecode ? std::launch::async : std::launch::deferred;
  const IRasterBackend &backend = backend_;

  std::vector<PendingPlan> pending;
  for (const FloorPlan &plan : snapshot.plans) {
    std::vector<const Observation *> findings =
        snapshot.ObservationsForPlan(plan.id);
    if (findings.empty())
      continue;
    PendingPlan entry;
    entry.plan = &plan;
    entry.pins = CollectPlanPins(plan, findings, numbering);
    pending.push_back(std::move(entry));
  }

  // At most kPlanDecodesInFlight full-resolution decodes are alive at once.
  // Each decoded surface is released once its pins are composited.
  size_t launched = 0;
  auto launchUpTo = [&](size_t limit) {
    for (; launched < pending.size() && launched < limit; ++launched) {
      const FloorPlan *plan = pending[launched].plan;
      pending[launched].decode = std::async(policy, [&backend, plan]() {
        PlanDecode result;
        result.surface = backend.Decode(plan->imageData, result.error);
        return result;
      });
    }
  };

  // Pages are emitted in stored plan order regardless of which decode
  // finishes first.
  for (size_t index = 0; index < pending.size(); ++index) {
    launchUpTo(index + kPlanDecodesInFlight);
    PendingPlan &entry = pending[index];
    const FloorPlan &plan = *entry.plan;
    CompositeResult composite;
    try {
      PlanDecode decoded = entry.decode.get();
      if (decoded.surface)
        composite = CompositeDecodedPlan(*decoded.surface, entry.pins, options);
      else
        composite.message =
            "Unable to decode plan '" + plan.name + "': " + decoded.error;
    } catch (const std::exception &ex) {
      composite = CompositeResult{};
      composite.message =
          "Exception while compositing plan '" + plan.name + "': " + ex.what();
    }

    if (!composite.success) {
      Logger::Instance().Log(LogLevel::Warning,
                             "Skipping map page: " + composite.message);
      report.skipped.push_back(
          SkippedItem{SkippedItem::Kind::Plan, plan.id, composite.message});
      continue;
    }

    canvas.BeginPage();
    const double centerX = canvas.PageWidth() / 2.0;
    canvas.DrawText(centerX, style_.marginPt,
                    "MAP REFERENCE: " + StringUtils::ToUpper(plan.name),
                    TextStyle(style_.sectionFontSize, true, kBlack,
                              Align::Center));

    const double imageTop = style_.marginPt + 10.0 * kMmPt;
    const double captionGap = 10.0 * kMmPt;
    const double maxHeight = std::min(
        style_.mapMaxHeightPt, style_.ContentBottom() - imageTop - captionGap);
    double drawWidth = 0.0;
    double drawHeight = 0.0;
    FitInside(composite.image.width, composite.image.height,
              style_.ContentWidth(), maxHeight, drawWidth, drawHeight);
    canvas.DrawImage(composite.image, centerX - drawWidth / 2.0, imageTop,
                     drawWidth, drawHeight);
    canvas.DrawText(centerX, imageTop + drawHeight + captionGap,
                    "Pins indicate location and match finding numbers in "
                    "detailed section.",
                    TextStyle(style_.metaFontSize, false, kCaptionText,
                              Align::Center));
    ++report.mapPages;
  }
}

void DocumentAssembler::RenderDetails(const InspectionSnapshot &snapshot,
                                      const FindingNumbering &numbering,
                                      IReportCanvas &canvas,
                                      AssemblyReport &report) {
  canvas.BeginPage();
  canvas.DrawText(style_.marginPt, style_.marginPt, "DETAILED FINDINGS",
                  TextStyle(style_.sectionFontSize, true, kBlack));

  PageCursor cursor(style_);
  cursor.MoveTo(style_.marginPt + 10.0 * kMmPt);
  for (const Observation &obs : snapshot.observations) {
    const int number = numbering.NumberOf(obs.id);
    std::vector<EncodedImage> photos = TranscodePhotos(obs, report);
    FindingBlockLayout layout =
        MeasureFindingBlock(canvas, style_, obs, photos.size());

    PlacementDecision decision = DecidePlacement(
        cursor, layout.height, "Finding #" + std::to_string(number));
    if (decision.newPage) {
      canvas.BeginPage();
      cursor.ResetToTop();
    }
    if (decision.oversized)
      ++report.oversizedBlocks;

    DrawFindingBlock(snapshot, obs, number, layout, photos, cursor.Y(), canvas);
    cursor.Advance(layout.height);
    ++report.findingBlocks;
    report.photosPlaced += photos.size();
  }
}

void DocumentAssembler::DrawFindingBlock(
    const InspectionSnapshot &snapshot, const Observation &observation,
    int number, const FindingBlockLayout &layout,
    const std::vector<EncodedImage> &photos, double top,
    IReportCanvas &canvas) {
  using Align = CanvasTextStyle::HorizontalAlign;
  const double left = style_.marginPt;
  const double right = canvas.PageWidth() - style_.marginPt;

  canvas.DrawLine(left, top, right, top, CanvasStroke{kBlockRuleColor, 0.5f});
  double y = top + style_.blockHeaderHeightPt * 0.6;
  canvas.DrawText(left, y, "Finding #" + std::to_string(number),
                  TextStyle(style_.headingFontSize, true, kBlack));
  canvas.DrawText(right, y, PriorityLabelUpper(observation.priority),
                  TextStyle(style_.headingFontSize, true,
                            style_.priorityColors.ColorFor(observation.priority),
                            Align::Right));

  y = top + style_.blockHeaderHeightPt;
  const double metaBaseline = style_.metadataLineHeightPt * 0.7;
  std::string location = "Unassigned";
  if (observation.planId) {
    if (const FloorPlan *plan = snapshot.FindPlan(*observation.planId))
      location = plan->name;
  }
  canvas.DrawText(left, y + metaBaseline, "Location: " + location,
                  TextStyle(style_.metaFontSize, false, kBlack));
  y += style_.metadataLineHeightPt;
  canvas.DrawText(left, y + metaBaseline,
                  "Trade: " + OrDefault(observation.trade, "N/A"),
                  TextStyle(style_.metaFontSize, true, kBlack));
  canvas.DrawText(right, y + metaBaseline,
                  "Responsible: " + OrDefault(observation.responsibleParty, "N/A"),
                  TextStyle(style_.metaFontSize, true, kBlack, Align::Right));
  y += style_.metadataLineHeightPt;

  const CanvasTextStyle body = TextStyle(style_.bodyFontSize, false, kBlack);
  const double lineBaseline = style_.lineHeightPt * 0.75;
  for (const std::string &line : layout.descriptionLines) {
    canvas.DrawText(left, y + lineBaseline, line, body);
    y += style_.lineHeightPt;
  }
  for (const std::string &line : layout.actionLines) {
    canvas.DrawText(left, y + lineBaseline, line, body);
    y += style_.lineHeightPt;
  }

  const CanvasTextStyle caption =
      TextStyle(style_.captionFontSize, false, kBlack, Align::Center);
  for (size_t i = 0; i < photos.size(); ++i) {
    const EncodedImage &photo = photos[i];
    GridCell cell = ImageGridCell(i, left, y, style_);
    double w = 0.0;
    double h = 0.0;
    FitInside(photo.width, photo.height, cell.size, cell.size, w, h);
    canvas.DrawImage(photo, cell.x + (cell.size - w) / 2.0,
                     cell.y + (cell.size - h) / 2.0, w, h);
    canvas.DrawText(cell.x + cell.size / 2.0,
                    cell.y + cell.size + style_.captionFontSize + 2.0,
                    "Photo " + std::to_string(i + 1), caption);
  }
}

std::vector<EncodedImage>
DocumentAssembler::TranscodePhotos(const Observation &observation,
                                   AssemblyReport &report) const {
  std::vector<EncodedImage> photos;
  photos.reserve(observation.images.size());
  for (size_t i = 0; i < observation.images.size(); ++i) {
    std::string error;
    EncodedImage encoded;
    bool ok = false;
    try {
      std::unique_ptr<IRasterSurface> surface =
          backend_.Decode(observation.images[i], error);
      ok = surface && surface->EncodeJpeg(style_.jpegQuality, encoded, error);
    } catch (const std::exception &ex) {
      error = std::string("exception: ") + ex.what();
      ok = false;
    }
    if (!ok) {
      std::string message = "Photo " + std::to_string(i + 1) + " of finding " +
                            observation.id + " skipped: " + error;
      Logger::Instance().Log(LogLevel::Warning, message);
      report.skipped.push_back(
          SkippedItem{SkippedItem::Kind::Photo, observation.id, message});
      continue;
    }
    photos.push_back(std::move(encoded));
  }
  return photos;
}
