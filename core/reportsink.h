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

#include <filesystem>
#include <string>

// Finished report handed over for saving or download
struct ReportArtifact {
  std::string fileName;
  std::string bytes;
  size_t pageCount = 0;
};

class IReportSink {
public:
  virtual ~IReportSink() = default;
  virtual bool Save(const ReportArtifact &artifact, std::string &error) = 0;
};

// Saves artifacts into a directory. The file is written under a temporary
// name first and renamed once complete, so a reader never sees a partial
// document.
class FileReportSink : public IReportSink {
public:
  explicit FileReportSink(std::filesystem::path directory);

  bool Save(const ReportArtifact &artifact, std::string &error) override;
  const std::filesystem::path &LastSavedPath() const { return lastSaved_; }

private:
  std::filesystem::path directory_;
  std::filesystem::path lastSaved_;
};
