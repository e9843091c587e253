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
#include "../report/reportexporter.h"
#include "testfakes.h"

#include <iostream>
#include <stdexcept>

namespace {

class MemorySink : public IReportSink {
public:
  bool Save(const ReportArtifact &artifact, std::string &error) override {
    ++saves;
    if (throwOnSave)
      throw std::runtime_error("sink exploded");
    if (fail) {
      error = "disk full";
      return false;
    }
    last = artifact;
    return true;
  }

  int saves = 0;
  bool fail = false;
  bool throwOnSave = false;
  ReportArtifact last;
};

InspectionSnapshot MakeSnapshot() {
  InspectionSnapshot snapshot;
  snapshot.project.name = "North Wing #2";
  snapshot.plans = {{"p1", "Level 1", "RASTER 800 600"}};
  Observation obs;
  obs.id = "o1";
  obs.note = "Cracked slab";
  obs.priority = Priority::High;
  obs.planId = std::string("p1");
  obs.coords = Coordinates{40, 60};
  obs.images = {"RASTER 100 100"};
  snapshot.observations.push_back(obs);
  return snapshot;
}

} // namespace

int main() {
  FakeRasterBackend backend;
  InspectionSnapshot snapshot = MakeSnapshot();

  {
    MemorySink sink;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    ReportOutcome outcome = exporter.Export(gate, {&snapshot, 1700000000});
    if (outcome.status != ExportStatus::Success || sink.saves != 1) {
      std::cerr << "Export failed: " << outcome.message << std::endl;
      return 1;
    }
    if (sink.last.fileName != "North_Wing__2_SiteReport.pdf" ||
        outcome.fileName != sink.last.fileName) {
      std::cerr << "Unexpected file name " << sink.last.fileName << std::endl;
      return 1;
    }
    // Cover, one map page, one details page
    if (outcome.pageCount != 3 || sink.last.pageCount != 3) {
      std::cerr << "Unexpected page count " << outcome.pageCount << std::endl;
      return 1;
    }
    const std::string &pdf = sink.last.bytes;
    if (pdf.rfind("%PDF-1.4", 0) != 0 || pdf.find("%%EOF") == std::string::npos ||
        pdf.find("/Count 3") == std::string::npos ||
        pdf.find("/DCTDecode") == std::string::npos) {
      std::cerr << "Artifact is not a complete PDF" << std::endl;
      return 1;
    }
    if (gate.State() != ExportState::Idle) {
      std::cerr << "Gate not released after export" << std::endl;
      return 1;
    }
  }

  // Zero findings is its own outcome and produces nothing
  {
    MemorySink sink;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    InspectionSnapshot empty = snapshot;
    empty.observations.clear();
    ReportOutcome outcome = exporter.Export(gate, {&empty, 0});
    if (outcome.status != ExportStatus::NothingToExport || sink.saves != 0) {
      std::cerr << "Empty snapshot not reported as NothingToExport" << std::endl;
      return 1;
    }
  }

  // A run already in flight makes the request a no-op
  {
    MemorySink sink;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    ExportGate::Ticket held = gate.TryBegin();
    ReportOutcome outcome = exporter.Export(gate, {&snapshot, 0});
    if (outcome.status != ExportStatus::Busy || sink.saves != 0) {
      std::cerr << "Concurrent export not rejected" << std::endl;
      return 1;
    }
    held.Release();
    if (exporter.Export(gate, {&snapshot, 0}).status != ExportStatus::Success) {
      std::cerr << "Export after release failed" << std::endl;
      return 1;
    }
  }

  // A photo whose decode throws is skipped like any other bad photo
  {
    MemorySink sink;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    InspectionSnapshot throwing = snapshot;
    throwing.observations[0].images = {"THROW", "RASTER 100 100"};
    ReportOutcome outcome = exporter.Export(gate, {&throwing, 0});
    if (outcome.status != ExportStatus::Success || sink.saves != 1 ||
        outcome.pageCount != 3 || outcome.skipped.size() != 1 ||
        outcome.skipped[0].kind != SkippedItem::Kind::Photo ||
        outcome.skipped[0].reason.find("backend exploded") ==
            std::string::npos) {
      std::cerr << "Throwing photo should only be skipped: " << outcome.message
                << std::endl;
      return 1;
    }
  }

  // Unexpected exceptions become Failed
  {
    MemorySink sink;
    sink.throwOnSave = true;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    ReportOutcome outcome = exporter.Export(gate, {&snapshot, 0});
    if (outcome.status != ExportStatus::Failed ||
        outcome.message.find("sink exploded") == std::string::npos) {
      std::cerr << "Exception not turned into a failure" << std::endl;
      return 1;
    }
    if (gate.State() != ExportState::Idle) {
      std::cerr << "Gate left running after failure" << std::endl;
      return 1;
    }
  }

  // Sink failures are reported
  {
    MemorySink sink;
    sink.fail = true;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    ReportOutcome outcome = exporter.Export(gate, {&snapshot, 0});
    if (outcome.status != ExportStatus::Failed ||
        outcome.message != "disk full") {
      std::cerr << "Sink failure not reported" << std::endl;
      return 1;
    }
  }

  // Skipped assets still yield a successful report
  {
    MemorySink sink;
    ReportExporter exporter(backend, ReportStyle(), sink);
    ExportGate gate;
    InspectionSnapshot corrupt = snapshot;
    corrupt.plans[0].imageData = "corrupt";
    ReportOutcome outcome = exporter.Export(gate, {&corrupt, 0});
    if (outcome.status != ExportStatus::Success || outcome.skipped.size() != 1 ||
        outcome.pageCount != 2) {
      std::cerr << "Corrupt plan should only drop its map page" << std::endl;
      return 1;
    }
  }
  return 0;
}
