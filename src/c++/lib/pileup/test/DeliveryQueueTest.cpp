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

#include "boost/test/unit_test.hpp"

#include "pileup/DeliveryQueue.hpp"

#include <vector>

BOOST_AUTO_TEST_SUITE(test_DeliveryQueue)

BOOST_AUTO_TEST_CASE(test_DeliveryQueue_Order)
{
  DeliveryQueue    queue;
  std::vector<int> order;

  queue.post([&order]() { order.push_back(1); });
  queue.post([&order, &queue]() {
    order.push_back(2);
    queue.post([&order]() { order.push_back(4); });
  });
  queue.post([&order]() { order.push_back(3); });

  BOOST_REQUIRE_EQUAL(queue.size(), 3u);
  BOOST_REQUIRE(order.empty());

  BOOST_REQUIRE_EQUAL(queue.runPending(), 4u);
  BOOST_REQUIRE(queue.empty());
  BOOST_REQUIRE_EQUAL(order.size(), 4u);
  for (unsigned i(0); i < order.size(); ++i) {
    BOOST_REQUIRE_EQUAL(order[i], static_cast<int>(i + 1));
  }

  BOOST_REQUIRE_EQUAL(queue.runPending(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
