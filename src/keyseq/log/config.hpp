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
#include <boost/array.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <cstdint>

namespace keyseq::log
{

// Types.

/**
 * Filtering and formatting settings shared by the supplied Logger%s.  A message passes the filter if its severity
 * is at most as verbose as the verbosity set for its component; or, for a component without one (including an
 * empty Component, or one whose payload is not a keyseq::Keyseq_log_component), the default verbosity.
 *
 * ### Thread safety ###
 * The verbosities may be changed while other threads log; a change is seen by them soon, not necessarily at once.
 * #m_use_human_friendly_time_stamps is not synchronized: set it before handing `*this` to a Logger.
 */
class Config :
  private boost::noncopyable
{
public:
  // Constants.

  /// Default verbosity if none is given.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs with the given default verbosity and no per-component ones.
   *
   * @param most_verbose_sev_default
   *        See configure_default_verbosity().
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  // Methods.

  /**
   * The filter; see class doc header.  Logger::should_log() implementations forward here.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component.
   * @return `true` to log.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Writes the name of the component, as in `KEYSEQ-COLLECTION`, if it is a keyseq::Keyseq_log_component.
   *
   * @param os
   *        Stream; not null.
   * @param component
   *        Component.
   * @return `true` if something was written.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Sets the verbosity for components without their own.
   *
   * @param most_verbose_sev_default
   *        Most verbose severity to pass.
   * @param reset
   *        If `true`, also forgets every per-component verbosity.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity for one component.
   *
   * @param most_verbose_sev
   *        Most verbose severity to pass.
   * @param component
   *        Component; not `S_END_SENTINEL`.
   */
  void configure_component_verbosity(Sev most_verbose_sev, Keyseq_log_component component);

  // Data.  (Public!)

  /// If `true`, messages are stamped with local date and time; else with seconds since the Epoch.
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// How a Sev is stored; #S_NO_SEV means not set.
  using raw_sev_t = uint8_t;

  // Constants.

  /// See #raw_sev_t.
  static constexpr raw_sev_t S_NO_SEV = 0xFF;

  // Data.

  /// See configure_default_verbosity().
  std::atomic<raw_sev_t> m_verbosity_default;

  /// See configure_component_verbosity(); indexed by the component's numeric value.
  boost::array<std::atomic<raw_sev_t>, size_t(Keyseq_log_component::S_END_SENTINEL)> m_verbosities_by_component;
}; // class Config

} // namespace keyseq::log
