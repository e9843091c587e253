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
#include "exportgate.h"

#include <utility>

ExportGate::Ticket::Ticket(Ticket &&other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)) {}

ExportGate::Ticket &ExportGate::Ticket::operator=(Ticket &&other) noexcept {
  if (this != &other) {
    Release();
    gate_ = std::exchange(other.gate_, nullptr);
  }
  return *this;
}

ExportGate::Ticket::~Ticket() { Release(); }

void ExportGate::Ticket::Release() {
  if (gate_) {
    gate_->running_.store(false);
    gate_ = nullptr;
  }
}

ExportGate::Ticket ExportGate::TryBegin() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true))
    return Ticket();
  return Ticket(this);
}

ExportState ExportGate::State() const {
  return running_.load() ? ExportState::Running : ExportState::Idle;
}
