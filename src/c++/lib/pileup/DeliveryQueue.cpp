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

#include "pileup/DeliveryQueue.hpp"

unsigned DeliveryQueue::runPending()
{
  unsigned taskCount(0);
  while (!_tasks.empty()) {
    // pop first, the task may post more tasks
    const task_t task(std::move(_tasks.front()));
    _tasks.pop_front();
    task();
    taskCount++;
  }
  return taskCount;
}
