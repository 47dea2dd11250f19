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

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **/

#pragma once

#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include <stdexcept>
#include <string>

namespace pileup {
namespace common {

/// \brief Virtual base class to all the exception classes
///
/// Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
/// at the throw site.
///
class ExceptionData : public boost::exception {
public:
  ExceptionData(const std::string& message, const int errorNumber = 0)
    : boost::exception(), _message(message), _errorNumber(errorNumber)
  {
  }

  ExceptionData(const ExceptionData&) = default;
  ExceptionData& operator=(const ExceptionData&) = delete;

  const std::string& getMessage() const { return _message; }

  std::string getContext() const;

private:
  const std::string _message;
  const int         _errorNumber;
};

/// A general purpose exception type
///
/// Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
/// at the throw site as follows:
///
///     BOOST_THROW_EXCEPTION(GeneralException("Error message"));
///
class GeneralException : public std::runtime_error, public ExceptionData {
public:
  explicit GeneralException(const std::string& message, const int errorNumber = 0)
    : std::runtime_error(message), ExceptionData(message, errorNumber)
  {
  }
};

/// internal inconsistency, indicates a programming error
class LogicException : public std::logic_error, public ExceptionData {
public:
  explicit LogicException(const std::string& message) : std::logic_error(message), ExceptionData(message) {}
};

/// a method was called with arguments or object state which does not meet its preconditions
class PreConditionException : public std::logic_error, public ExceptionData {
public:
  explicit PreConditionException(const std::string& message)
    : std::logic_error(message), ExceptionData(message)
  {
  }
};

/// end-user supplied value cannot be used, such as an unparsable region string
class InvalidParameterException : public std::invalid_argument, public ExceptionData {
public:
  explicit InvalidParameterException(const std::string& message)
    : std::invalid_argument(message), ExceptionData(message)
  {
  }
};

/// a data source could not provide the requested reference or alignment data
///
/// This is never fatal to the pileup engine: data sources convert it into a failed fetch completion, after
/// which the request can be retried.
class FetchException : public std::runtime_error, public ExceptionData {
public:
  explicit FetchException(const std::string& message, const int errorNumber = 0)
    : std::runtime_error(message), ExceptionData(message, errorNumber)
  {
  }
};

/// a single alignment record is internally inconsistent
///
/// The offending record is skipped, the remainder of its batch is still processed.
class MalformedRecordException : public std::runtime_error, public ExceptionData {
public:
  explicit MalformedRecordException(const std::string& message)
    : std::runtime_error(message), ExceptionData(message)
  {
  }
};

}  // namespace common
}  // namespace pileup
