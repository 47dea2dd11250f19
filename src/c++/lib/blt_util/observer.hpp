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
/// \brief simple observer/notifier pattern
///
/// see unit test for demonstration, note this is not meant to be used across threads
///

#pragma once

#include <set>

template <typename T>
struct notifier;

/// an observer unregisters itself from all of its notifiers when destroyed, and a notifier likewise
/// unregisters itself from all of its observers, so either side may be destroyed first
template <typename T>
struct observer {
  friend struct notifier<T>;

  typedef observer self_t;

  observer() {}

  observer(const self_t&) {}  // do not copy notifier set

  virtual ~observer()
  {
    for (typename nots_t::value_type val : _nots) {
      val->unregister_observer(this);
    }
  }

protected:
  void observe_notifier(const notifier<T>& n)
  {
    n.register_observer(this);
    _nots.insert(&n);
  }

private:
  self_t& operator=(const self_t&) = delete;

  virtual void receive_notification(const notifier<T>&, const T&) = 0;

  void unregister_notifier(const notifier<T>* n) { _nots.erase(n); }

  ////////// data:
  typedef typename std::set<const notifier<T>*> nots_t;
  nots_t                                        _nots;
};

template <typename T>
struct notifier {
  friend struct observer<T>;

  typedef notifier self_t;

  notifier() {}

  virtual ~notifier()
  {
    for (typename obss_t::value_type val : _obss) {
      val->unregister_notifier(this);
    }
  }

protected:
  void notify_observers(const T& msg) const
  {
    // copy so that an observer may be destroyed from inside its notification
    const obss_t obss(_obss);
    for (typename obss_t::value_type val : obss) {
      if (_obss.count(val) == 0) continue;
      val->receive_notification(*this, msg);
    }
  }

private:
  notifier(const self_t&) = delete;
  self_t& operator=(const self_t&) = delete;

  void register_observer(observer<T>* n) const { _obss.insert(n); }

  void unregister_observer(observer<T>* n) const { _obss.erase(n); }

  ////////// data:
  typedef typename std::set<observer<T>*> obss_t;
  mutable obss_t                          _obss;
};
