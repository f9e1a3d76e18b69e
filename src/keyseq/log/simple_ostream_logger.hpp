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
#include <iostream>

namespace keyseq::log
{

// Types.

/**
 * Logger writing messages of severity WARNING and worse to one `ostream` (`cerr` by default), the rest to another
 * (`cout` by default).  The two may be the same stream.  Filtering and format follow the given Config.  do_log()
 * may be called concurrently: a mutex keeps lines whole.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the Logger.  Nothing is written yet.
   *
   * @param config
   *        Settings; must outlive `*this`.
   * @param os
   *        Stream for messages less severe than WARNING; must outlive `*this`.
   * @param os_for_err
   *        Stream for the rest; must outlive `*this`.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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
   * Writes the line to the stream chosen by severity.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  // Data.  (Public!)

  /// The Config given to the constructor.
  Config* const m_config;

private:
  // Data.

  /// Writer to the `os` stream.
  Ostream_log_msg_writer m_writer;

  /// Writer to the `os_for_err` stream.
  Ostream_log_msg_writer m_err_writer;

  /// Held during each do_log().
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace keyseq::log
