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

#include "keyseq/log/log.hpp"
#include <ostream>

namespace keyseq::log
{

// Types.

/**
 * Writes log messages, one per line, to an `ostream`, in the form
 *
 *   ~~~
 *   <time stamp> [<sev>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>
 *   ~~~
 *
 * `<sev>` is a 4-letter abbreviation such as `warn`.  The `<component>: ` part appears only if the Config can name
 * the component.  The time stamp is `<sec>.<usec>` since the Epoch; or, per Config::m_use_human_friendly_time_stamps
 * at construction, local date, time to the microsecond, and UTC offset.
 *
 * Not thread-safe: the owning Logger serializes log() calls.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.  Nothing is written yet.
   *
   * @param config
   *        Settings; must outlive `*this`.
   * @param os
   *        Target; must outlive `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one line, flushing the stream.
   *
   * @param metadata
   *        Everything but the text.
   * @param msg
   *        The text.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Data.

  /// See constructor.
  const Config& m_config;

  /// Config::m_use_human_friendly_time_stamps at construction.
  const bool m_human_friendly_time_stamps;

  /// See constructor.
  std::ostream& m_os;
}; // class Ostream_log_msg_writer

} // namespace keyseq::log
