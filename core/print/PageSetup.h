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

#include <optional>
#include <string>
#include <utility>

namespace print {

enum class PageSize { A4 = 0, A3 = 1, Letter = 2 };

const char *PageSizeName(PageSize size);
std::optional<PageSize> ParsePageSize(const std::string &name);

struct PageSetup {
  PageSize pageSize = PageSize::A4;
  bool landscape = false;

  double PageWidthPt() const;
  double PageHeightPt() const;

private:
  std::pair<double, double> BasePageSizeMm() const;
};

} // namespace print
