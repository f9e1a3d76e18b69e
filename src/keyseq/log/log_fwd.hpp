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

#include "keyseq/util/util_fwd.hpp"
#include "keyseq/common.hpp"
#include <iosfwd>

/**
 * Logging for keyseq, and for user code that wants to log the same way.  keyseq classes take a `Logger*` at
 * construction; null disables logging.  Simple_ostream_logger (to `ostream`s) and Buffer_logger (to memory) are
 * the supplied Logger%s; each consults a Config for filtering.
 *
 * A message is logged through one of the `KEYSEQ_LOG_...()` macros in log.hpp, which assemble it only after
 * Logger::should_log() has said yes.  The macros find the Logger and Component through `get_logger()` and
 * `get_log_component()` in the calling scope: derive from Log_context, or use KEYSEQ_LOG_SET_CONTEXT().
 *
 * Logging does not replace error reporting: see keyseq::Error_code.
 */
namespace keyseq::log
{
// Types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Message severity, from most to least severe.  Numeric values are 0, 1, ... in that order, so a Sev can index a
 * table.  A filter set to severity `S` passes messages of `S` and every more severe value.
 *
 * Within keyseq: WARNING for each emitted error; DEBUG for collection creation; TRACE for each collection mutation.
 */
enum class Sev : size_t
{
  /// Not for messages: a filter at this level passes nothing.
  S_NONE = 0,
  /// The program cannot continue.
  S_FATAL,
  /// Bad; worse than a warning.
  S_ERROR,
  /// Bad, but rare enough to log always.
  S_WARNING,
  /// Not bad, and rare.
  S_INFO,
  /// INFO-like volume, of less interest.
  S_DEBUG,
  /// Frequent; leaving it off must cost next to nothing.
  S_TRACE,
  /// TRACE that also dumps variable-length data.
  S_DATA,
  /// Not a severity: the number of values above.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Reads a Sev: either its name as written by `<<` (any case), or its number.  Anything else yields Sev::S_NONE.
 * With `<<` this lets boost.program_options parse a Sev option.
 *
 * @param is
 *        Stream; one whitespace-delimited token is consumed.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Writes the upper-case name of the Sev, such as `WARNING`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace keyseq::log
