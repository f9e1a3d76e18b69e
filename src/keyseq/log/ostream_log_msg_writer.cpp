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
#include "keyseq/log/ostream_log_msg_writer.hpp"
#include "keyseq/log/config.hpp"
#include "keyseq/util/fmt.hpp"
#include <chrono>
#include <iterator>

namespace keyseq::log
{

namespace
{

/// Abbreviation of each Sev, indexed by its numeric value.  S_NONE is never logged.
constexpr char const * S_SEV_ABBREVS[] = { "none", "fatl", "eror", "warn", "info", "debg", "trce", "data" };

static_assert(std::size(S_SEV_ABBREVS) == size_t(Sev::S_END_SENTINEL), "One abbreviation per Sev please.");

} // Anonymous namespace

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_human_friendly_time_stamps(m_config.m_use_human_friendly_time_stamps),
  m_os(os)
{
  // Nothing else.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  const auto usec_since_epoch = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count();
  const auto usec = usec_since_epoch % 1000000;
  const auto sev_idx = size_t(metadata.m_msg_sev);

  if (m_human_friendly_time_stamps)
  {
    // localtime() has 1-second resolution; the microseconds come separately.
    const auto local_tm = fmt::localtime(system_clock::to_time_t(metadata.m_called_when));
    m_os << fmt::format("{0:%Y-%m-%d %H:%M:%S}.{1:06d} {0:%z} ", local_tm, usec);
  }
  else
  {
    m_os << fmt::format("{}.{:06d} ", usec_since_epoch / 1000000, usec);
  }

  m_os << '[' << ((sev_idx < std::size(S_SEV_ABBREVS)) ? S_SEV_ABBREVS[sev_idx] : "????") << "]: T";
  if (metadata.m_call_thread_nickname.empty())
  {
    m_os << metadata.m_call_thread_id;
  }
  else
  {
    m_os << metadata.m_call_thread_nickname;
  }
  m_os << ": ";

  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << util::where_am_i_str(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": " << msg << '\n' << std::flush;
} // Ostream_log_msg_writer::log()

} // namespace keyseq::log
