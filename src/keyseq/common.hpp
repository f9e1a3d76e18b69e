/* keyseq
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


/// @file
#pragma once

#include <boost/system/error_code.hpp>
#include <ostream>

// The API headers use nested namespace definitions, `std::string_view`, and `if constexpr`.
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any keyseq/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the keyseq project.  keyseq provides ordered, key-addressable collections of named
 * columns (namespace keyseq::collection), together with the small facilities they are built on: logging
 * (keyseq::log), error reporting (keyseq::error), and miscellany (keyseq::util).
 *
 * ### Error reporting ###
 * Every public method that can fail takes a trailing `Error_code* err_code`.  Non-null: `*err_code` is set to
 * success (falsy) or the specific failure.  Null: error::Runtime_error carrying that same code is thrown on failure.
 * Either way an operation that fails leaves the collection as it was.
 *
 * ### Logging ###
 * Each collection takes a `log::Logger*` at construction (null disables logging) and logs its structural
 * mutations at TRACE severity under component Keyseq_log_component::S_COLLECTION.
 */
namespace keyseq
{

// Types.

/// Short-hand for a boost.system error code: an `enum` value plus the category that gives it a message.
using Error_code = boost::system::error_code;

/**
 * The log::Component payloads keyseq uses for its own log call sites; one per module that logs.  A log::Config can
 * set a verbosity per value; and log output names the value as `KEYSEQ-<NAME>`.
 */
enum class Keyseq_log_component : unsigned int
{
  /// keyseq::log itself (thread nickname changes).
  S_LOG = 0,
  /// keyseq::error, and user code following its conventions.
  S_ERROR,
  /// keyseq::collection.
  S_COLLECTION,
  /// Not a component: the number of components.
  S_END_SENTINEL
}; // enum class Keyseq_log_component

// Free functions.

/**
 * Writes the upper-case name of the component (e.g., `COLLECTION`), without any prefix.
 *
 * @param os
 *        Stream.
 * @param val
 *        Component; `S_END_SENTINEL` is written as `?`.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Keyseq_log_component val);

} // namespace keyseq
