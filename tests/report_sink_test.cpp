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
#include "../core/reportsink.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

int main() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "inspectra_sink_test" / "nested";
  fs::remove_all(dir.parent_path());

  FileReportSink sink(dir);
  ReportArtifact artifact;
  artifact.fileName = "Site_SiteReport.pdf";
  artifact.bytes = std::string("%PDF-1.4\n\0binary", 16);
  artifact.pageCount = 1;

  std::string error;
  if (!sink.Save(artifact, error)) {
    std::cerr << "Save failed: " << error << std::endl;
    return 1;
  }
  if (sink.LastSavedPath() != dir / artifact.fileName) {
    std::cerr << "Unexpected saved path " << sink.LastSavedPath() << std::endl;
    return 1;
  }

  std::ifstream in(sink.LastSavedPath(), std::ios::binary);
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (data != artifact.bytes) {
    std::cerr << "Saved bytes differ" << std::endl;
    return 1;
  }
  fs::path partial = sink.LastSavedPath();
  partial += ".part";
  if (fs::exists(partial)) {
    std::cerr << "Temporary file left behind" << std::endl;
    return 1;
  }

  // Saving again replaces the previous report
  artifact.bytes = "%PDF-1.4 second";
  if (!sink.Save(artifact, error)) {
    std::cerr << "Overwrite failed: " << error << std::endl;
    return 1;
  }
  in.close();
  fs::remove_all(dir.parent_path());
  return 0;
}
