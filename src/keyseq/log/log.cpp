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
#include "keyseq/log/log.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/array.hpp>
#include <istream>
#include <string>

namespace keyseq::log
{

namespace
{

/// Name of each Sev, indexed by its numeric value.
const boost::array<char const *, size_t(Sev::S_END_SENTINEL)> S_SEV_NAMES
  {{ "NONE", "FATAL", "ERROR", "WARNING", "INFO", "DEBUG", "TRACE", "DATA" }};

} // Anonymous namespace

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Logger implementations.

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr) // Static.
{
  s_this_thread_nickname_ptr.reset(thread_nickname.empty() ? 0 : new std::string(thread_nickname));

  if (logger_ptr)
  {
    KEYSEQ_LOG_SET_CONTEXT(logger_ptr, Keyseq_log_component::S_LOG);
    KEYSEQ_LOG_INFO("Thread ID [" << boost::this_thread::get_id() << "] now logs as "
                    "[" << thread_nickname << "].");
  }
}

void Logger::set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata) // Static.
{
  const auto nickname_ptr = s_this_thread_nickname_ptr.get();
  if (nickname_ptr)
  {
    msg_metadata->m_call_thread_nickname = *nickname_ptr;
  }
  else
  {
    msg_metadata->m_call_thread_id = boost::this_thread::get_id();
  }
}

// Component implementations.

Component::Component() :
  m_payload_type_or_null(0),
  m_payload_enum_raw_value(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return !m_payload_type_or_null;
}

const std::type_info& Component::payload_type() const
{
  return *m_payload_type_or_null;
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  return m_payload_enum_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  Log_context()
{
  swap(src);
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    Log_context(std::move(src)).swap(*this);
  }
  return *this;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
  swap(m_component, other.m_component);
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::set_logger(Logger* logger)
{
  m_logger = logger;
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  const auto idx = size_t(val);
  return (idx < S_SEV_NAMES.size()) ? (os << S_SEV_NAMES[idx]) : (os << '?');
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  std::string token;
  is >> token;

  val = Sev::S_NONE;
  for (size_t idx = 0; idx != S_SEV_NAMES.size(); ++idx)
  {
    if (boost::algorithm::iequals(token, S_SEV_NAMES[idx]) || (token == std::to_string(idx)))
    {
      val = Sev(idx);
      break;
    }
  }
  return is;
}

} // namespace keyseq::log
