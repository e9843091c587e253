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
#include "logger.h"
#include "reportconfig.h"
#include "reportexporter.h"
#include "reportsink.h"
#include "snapshotloader.h"
#include "wxrasterbackend.h"

#include <chrono>
#include <iostream>

#include <wx/cmdline.h>
#include <wx/image.h>
#include <wx/init.h>

namespace {

enum ExitCode {
  kExitSuccess = 0,
  kExitFailure = 1,
  kExitNothingToExport = 2,
  kExitBusy = 3
};

int ExitCodeFor(ExportStatus status) {
  switch (status) {
  case ExportStatus::Success:
    return kExitSuccess;
  case ExportStatus::NothingToExport:
    return kExitNothingToExport;
  case ExportStatus::Busy:
    return kExitBusy;
  case ExportStatus::Failed:
    return kExitFailure;
  }
  return kExitFailure;
}

const wxCmdLineEntryDesc kCommandLine[] = {
    {wxCMD_LINE_SWITCH, "h", "help", "show this help", wxCMD_LINE_VAL_NONE,
     wxCMD_LINE_OPTION_HELP},
    {wxCMD_LINE_OPTION, "s", "style", "report style JSON file",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, "o", "output-dir", "directory for the PDF",
     wxCMD_LINE_VAL_STRING, 0},
    {wxCMD_LINE_OPTION, "t", "generated-at",
     "generation time in epoch seconds", wxCMD_LINE_VAL_NUMBER, 0},
    {wxCMD_LINE_PARAM, nullptr, nullptr, "snapshot.json",
     wxCMD_LINE_VAL_STRING, 0},
    wxCMD_LINE_DESC_END};

} // namespace

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    std::cerr << "Failed to initialize wxWidgets." << std::endl;
    return kExitFailure;
  }
  wxInitAllImageHandlers();

  wxCmdLineParser parser(kCommandLine, argc, argv);
  parser.SetLogo("Inspectra site report generator");
  int parsed = parser.Parse();
  if (parsed == -1)
    return kExitSuccess;
  if (parsed != 0)
    return kExitFailure;

  Logger::Instance();

  ReportStyle style;
  std::string error;
  wxString stylePath;
  if (parser.Found("style", &stylePath) &&
      !LoadReportStyle(stylePath.ToStdString(), style, error)) {
    Logger::Instance().Log(LogLevel::Error, error);
    return kExitFailure;
  }

  InspectionSnapshot snapshot;
  std::string snapshotPath = parser.GetParam(0).ToStdString();
  if (!LoadInspectionSnapshot(snapshotPath, snapshot, error)) {
    Logger::Instance().Log(LogLevel::Error, error);
    return kExitFailure;
  }

  wxString outputDir = ".";
  parser.Found("output-dir", &outputDir);

  long generatedAt = 0;
  if (!parser.Found("generated-at", &generatedAt))
    generatedAt = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());

  WxRasterBackend backend;
  FileReportSink sink(outputDir.ToStdString());
  ReportExporter exporter(backend, style, sink);
  ExportGate gate;

  ExportRequest request;
  request.snapshot = &snapshot;
  request.generatedAtSeconds = generatedAt;
  ReportOutcome outcome = exporter.Export(gate, request);

  std::cout << ExportStatusName(outcome.status) << ": " << outcome.message
            << std::endl;
  if (outcome.Succeeded())
    std::cout << sink.LastSavedPath().string() << std::endl;
  for (const SkippedItem &item : outcome.skipped)
    std::cout << "  skipped: " << item.reason << std::endl;
  return ExitCodeFor(outcome.status);
}
