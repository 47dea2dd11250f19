//
// Pileup - Genomic Read Pileup Track
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include <deque>
#include <functional>

/// \brief FIFO of deferred fetch completions
///
/// Data sources post their completions here instead of invoking them from inside fetch, so that a
/// completion never re-enters the code which issued the request. The host drains the queue.
struct DeliveryQueue {
  typedef std::function<void()> task_t;

  void post(task_t task) { _tasks.push_back(std::move(task)); }

  /// run posted tasks in FIFO order until the queue is empty, including tasks posted while running
  ///
  /// \return number of tasks run
  unsigned runPending();

  bool empty() const { return _tasks.empty(); }

  unsigned size() const { return _tasks.size(); }

private:
  std::deque<task_t> _tasks;
};
