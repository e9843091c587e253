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

#include "reportexporter.h"

#include <exception>
#include <utility>

#include "logger.h"
#include "pdf/pdf_report_canvas.h"
#include "stringutils.h"

const char *ExportStatusName(ExportStatus status) {
  switch (status) {
  case ExportStatus::Success:
    return "Success";
  case ExportStatus::NothingToExport:
    return "NothingToExport";
  case ExportStatus::Failed:
    return "Failed";
  case ExportStatus::Busy:
    return "Busy";
  }
  return "Unknown";
}

ReportExporter::ReportExporter(const IRasterBackend &backend,
                               ReportStyle style, IReportSink &sink)
    : backend_(backend), style_(std::move(style)), sink_(sink) {}

ReportOutcome ReportExporter::Export(ExportGate &gate,
                                     const ExportRequest &request) {
  ReportOutcome outcome;
  ExportGate::Ticket ticket = gate.TryBegin();
  if (!ticket) {
    outcome.status = ExportStatus::Busy;
    outcome.message = "A report is already being generated.";
    Logger::Instance().Log(LogLevel::Warning, outcome.message);
    return outcome;
  }

  if (!request.snapshot) {
    outcome.message = "No project snapshot supplied.";
    Logger::Instance().Log(LogLevel::Error, outcome.message);
    return outcome;
  }

  const InspectionSnapshot &snapshot = *request.snapshot;
  if (snapshot.observations.empty()) {
    outcome.status = ExportStatus::NothingToExport;
    outcome.message = "No findings to export.";
    Logger::Instance().Log(outcome.message);
    return outcome;
  }

  try {
    return Run(snapshot, request.generatedAtSeconds);
  } catch (const std::exception &ex) {
    outcome.status = ExportStatus::Failed;
    outcome.message = std::string("Report generation failed: ") + ex.what();
    Logger::Instance().Log(LogLevel::Error, outcome.message);
    return outcome;
  }
}

ReportOutcome ReportExporter::Run(const InspectionSnapshot &snapshot,
                                  int64_t generatedAtSeconds) {
  ReportOutcome outcome;
  outcome.fileName = StringUtils::ReportFileName(snapshot.project.name);
  Logger::Instance().Log("Generating " + outcome.fileName + " (" +
                         std::to_string(snapshot.observations.size()) +
                         " findings, " + std::to_string(snapshot.plans.size()) +
                         " plans)");

  PdfReportCanvas canvas(style_.PageWidth(), style_.PageHeight(),
                         snapshot.project.name + " Site Report");
  DocumentAssembler assembler(backend_, style_);
  AssemblyReport assembly =
      assembler.Assemble(snapshot, generatedAtSeconds, canvas);
  outcome.skipped = std::move(assembly.skipped);

  ReportArtifact artifact;
  artifact.fileName = outcome.fileName;
  artifact.pageCount = canvas.PageCount();
  std::string error;
  if (!canvas.Serialize(artifact.bytes, error)) {
    outcome.status = ExportStatus::Failed;
    outcome.message = error;
    Logger::Instance().Log(LogLevel::Error, "PDF serialization failed: " + error);
    return outcome;
  }
  if (!sink_.Save(artifact, error)) {
    outcome.status = ExportStatus::Failed;
    outcome.message = error;
    Logger::Instance().Log(LogLevel::Error,
                           "Unable to save " + artifact.fileName + ": " + error);
    return outcome;
  }

  outcome.status = ExportStatus::Success;
  outcome.pageCount = artifact.pageCount;
  outcome.byteCount = artifact.bytes.size();
  outcome.message = "Report saved: " + artifact.fileName + " (" +
                    std::to_string(outcome.pageCount) + " pages)";
  if (!outcome.skipped.empty())
    outcome.message +=
        ", " + std::to_string(outcome.skipped.size()) + " assets skipped";
  Logger::Instance().Log(outcome.message);
  return outcome;
}
