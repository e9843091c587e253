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
#include "PageSetup.h"

namespace {
constexpr double kMmToPoints = 72.0 / 25.4;
} // namespace

namespace print {

const char *PageSizeName(PageSize size) {
  switch (size) {
  case PageSize::A3:
    return "A3";
  case PageSize::Letter:
    return "Letter";
  case PageSize::A4:
  default:
    return "A4";
  }
}

std::optional<PageSize> ParsePageSize(const std::string &name) {
  if (name == "A4")
    return PageSize::A4;
  if (name == "A3")
    return PageSize::A3;
  if (name == "Letter")
    return PageSize::Letter;
  return std::nullopt;
}

std::pair<double, double> PageSetup::BasePageSizeMm() const {
  switch (pageSize) {
  case PageSize::A3:
    return {297.0, 420.0};
  case PageSize::Letter:
    return {215.9, 279.4};
  case PageSize::A4:
  default:
    return {210.0, 297.0};
  }
}

double PageSetup::PageWidthPt() const {
  auto [portraitW, portraitH] = BasePageSizeMm();
  const double mm = landscape ? portraitH : portraitW;
  return mm * kMmToPoints;
}

double PageSetup::PageHeightPt() const {
  auto [portraitW, portraitH] = BasePageSizeMm();
  const double mm = landscape ? portraitW : portraitH;
  return mm * kMmToPoints;
}

} // namespace print
