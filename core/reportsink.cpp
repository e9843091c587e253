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
#include "reportsink.h"

#include <fstream>
#include <system_error>
#include <utility>

#include "logger.h"

namespace fs = std::filesystem;

FileReportSink::FileReportSink(fs::path directory)
    : directory_(std::move(directory)) {}

bool FileReportSink::Save(const ReportArtifact &artifact, std::string &error) {
  std::error_code ec;
  if (!directory_.empty() && !fs::exists(directory_, ec))
    fs::create_directories(directory_, ec);
  if (ec) {
    error = "Unable to create output directory: " + ec.message();
    return false;
  }

  const fs::path target = directory_ / artifact.fileName;
  fs::path partial = target;
  partial += ".part";
  {
    std::ofstream file(partial, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      error = "Unable to open the destination file for writing.";
      return false;
    }
    file.write(artifact.bytes.data(),
               static_cast<std::streamsize>(artifact.bytes.size()));
    if (!file.good()) {
      error = "Failed while writing the report file.";
      file.close();
      fs::remove(partial, ec);
      return false;
    }
  }

  fs::rename(partial, target, ec);
  if (ec) {
    error = "Unable to finalize report file: " + ec.message();
    fs::remove(partial, ec);
    return false;
  }
  lastSaved_ = target;
  Logger::Instance().Log("Saved report to " + target.string());
  return true;
}
