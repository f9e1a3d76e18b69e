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

#include "keyseq/log/ostream_log_msg_writer.hpp"
#include <string>

namespace keyseq::log
{

// Types.

/**
 * Logger that appends each line to an in-memory string, as Simple_ostream_logger would write it.  Mostly for
 * tests that check what was logged.  do_log() and buffer_str_copy() may be called concurrently.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs with an empty buffer.
   *
   * @param config
   *        Settings; must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Per Config::output_whether_should_log().
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Appends the line to the buffer.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Copy of everything logged so far.
   *
   * @return See above.
   */
  std::string buffer_str_copy() const;

  // Data.  (Public!)

  /// The Config given to the constructor.
  Config* const m_config;

private:
  // Data.

  /// The log.
  std::string m_buffer;

  /// Appends to #m_buffer.
  util::String_appender m_buffer_os;

  /// Formats into #m_buffer_os.
  Ostream_log_msg_writer m_writer;

  /// Guards the above.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_logger

} // namespace keyseq::log
