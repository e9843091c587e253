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

#include <atomic>

enum class ExportState { Idle, Running };

// In-flight token for document generation. The caller owns one gate per
// project and hands it to every export request; at most one ticket can be
// held at a time.
class ExportGate {
public:
  class Ticket {
  public:
    Ticket() = default;
    Ticket(const Ticket &) = delete;
    Ticket &operator=(const Ticket &) = delete;
    Ticket(Ticket &&other) noexcept;
    Ticket &operator=(Ticket &&other) noexcept;
    ~Ticket();

    explicit operator bool() const { return gate_ != nullptr; }
    void Release();

  private:
    friend class ExportGate;
    explicit Ticket(ExportGate *gate) : gate_(gate) {}
    ExportGate *gate_ = nullptr;
  };

  ExportGate() = default;
  ExportGate(const ExportGate &) = delete;
  ExportGate &operator=(const ExportGate &) = delete;

  // Returns an empty ticket when a run is already in flight.
  Ticket TryBegin();
  ExportState State() const;

private:
  std::atomic<bool> running_{false};
};
