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

#include "../core/exportgate.h"
#include "../core/reportconfig.h"
#include "../core/reportsink.h"
#include "../models/inspectionsnapshot.h"
#include "../render/rastersurface.h"
#include "documentassembler.h"

enum class ExportStatus { Success, NothingToExport, Failed, Busy };

const char *ExportStatusName(ExportStatus status);

struct ReportOutcome {
  ExportStatus status = ExportStatus::Failed;
  std::string message;
  std::string fileName;
  size_t pageCount = 0;
  size_t byteCount = 0;
  std::vector<SkippedItem> skipped;

  bool Succeeded() const { return status == ExportStatus::Success; }
};

struct ExportRequest {
  const InspectionSnapshot *snapshot = nullptr;
  int64_t generatedAtSeconds = 0;
};

// Runs one report generation: assembles the document, serializes it to PDF
// and hands it to the sink. Only one run per gate can be in flight; a
// concurrent request returns Busy without touching the sink.
class ReportExporter {
public:
  ReportExporter(const IRasterBackend &backend, ReportStyle style,
                 IReportSink &sink);

  ReportOutcome Export(ExportGate &gate, const ExportRequest &request);

private:
  ReportOutcome Run(const InspectionSnapshot &snapshot,
                    int64_t generatedAtSeconds);

  const IRasterBackend &backend_;
  ReportStyle style_;
  IReportSink &sink_;
};
