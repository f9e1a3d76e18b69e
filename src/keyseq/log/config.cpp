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
#include "keyseq/log/config.hpp"

namespace keyseq::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(raw_sev_t(most_verbose_sev_default))
{
  for (auto& verbosity : m_verbosities_by_component)
  {
    verbosity.store(S_NO_SEV, std::memory_order_relaxed);
  }
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  using std::memory_order_relaxed;

  raw_sev_t most_verbose_sev = S_NO_SEV;
  if (component.holds<Keyseq_log_component>())
  {
    const auto idx = size_t(component.payload_enum_raw_value());
    if (idx < m_verbosities_by_component.size())
    {
      most_verbose_sev = m_verbosities_by_component[idx].load(memory_order_relaxed);
    }
  }
  if (most_verbose_sev == S_NO_SEV)
  {
    most_verbose_sev = m_verbosity_default.load(memory_order_relaxed);
  }

  return raw_sev_t(sev) <= most_verbose_sev;
}

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  if (!component.holds<Keyseq_log_component>())
  {
    return false;
  }
  // else
  *os << "KEYSEQ-" << component.payload<Keyseq_log_component>();
  return true;
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  using std::memory_order_relaxed;

  m_verbosity_default.store(raw_sev_t(most_verbose_sev_default), memory_order_relaxed);
  if (reset)
  {
    for (auto& verbosity : m_verbosities_by_component)
    {
      verbosity.store(S_NO_SEV, memory_order_relaxed);
    }
  }
}

void Config::configure_component_verbosity(Sev most_verbose_sev, Keyseq_log_component component)
{
  m_verbosities_by_component.at(size_t(component)).store(raw_sev_t(most_verbose_sev), std::memory_order_relaxed);
}

} // namespace keyseq::log
