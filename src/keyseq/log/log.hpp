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

#include "keyseq/log/log_fwd.hpp"
#include "keyseq/util/util.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include <chrono>
#include <string>
#include <type_traits>
#include <typeinfo>

// Macros.

/**
 * Logs a WARNING message to `*get_logger()` under component `get_log_component()`, if that Logger's
 * Logger::should_log() allows it; otherwise the message is not even assembled.  Both functions must be visible at
 * the call site: derive from log::Log_context, or invoke KEYSEQ_LOG_SET_CONTEXT() first.
 *
 * @param ARG_stream_fragment
 *        `<<`-separated items, as in `KEYSEQ_LOG_WARNING("Key [" << key << "] not found.")`.  No trailing newline.
 */
#define KEYSEQ_LOG_WARNING(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_WARNING, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at FATAL severity.
#define KEYSEQ_LOG_FATAL(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_FATAL, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at ERROR severity.
#define KEYSEQ_LOG_ERROR(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_ERROR, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at INFO severity.
#define KEYSEQ_LOG_INFO(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_INFO, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at DEBUG severity.
#define KEYSEQ_LOG_DEBUG(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_DEBUG, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at TRACE severity.
#define KEYSEQ_LOG_TRACE(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_TRACE, ARG_stream_fragment)

/// KEYSEQ_LOG_WARNING() but at DATA severity.
#define KEYSEQ_LOG_DATA(ARG_stream_fragment) \
  KEYSEQ_LOG_WITH_CHECKING(::keyseq::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * Makes `KEYSEQ_LOG_...()` usable in the rest of the current scope, where no Log_context is at hand (a free
 * function, say): defines local `get_logger()` and `get_log_component()`.
 *
 * @param ARG_logger_ptr
 *        `Logger*`; null disables logging.
 * @param ARG_component_payload
 *        `enum` value from which to make the log::Component.
 */
#define KEYSEQ_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] const auto get_logger \
    = [KEYSEQ_LOG_SET_CTX_logger = static_cast<::keyseq::log::Logger*>(ARG_logger_ptr)]() \
        -> ::keyseq::log::Logger* { return KEYSEQ_LOG_SET_CTX_logger; }; \
  [[maybe_unused]] const auto get_log_component \
    = [KEYSEQ_LOG_SET_CTX_component = ::keyseq::log::Component(ARG_component_payload)]() \
        -> const ::keyseq::log::Component& { return KEYSEQ_LOG_SET_CTX_component; }

/**
 * Logs the message at the given severity if `get_logger()` is not null and its Logger::should_log() allows it.
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ARG_stream_fragment
 *        See KEYSEQ_LOG_WARNING().
 */
#define KEYSEQ_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  KEYSEQ_UTIL_SEMICOLON_SAFE \
  ( \
    ::keyseq::log::Logger const * const KEYSEQ_LOG_W_CHK_logger = get_logger(); \
    if (KEYSEQ_LOG_W_CHK_logger && KEYSEQ_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      KEYSEQ_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Logs the message at the given severity, skipping Logger::should_log().  For use after the caller has made that
 * check itself.  A null `get_logger()` still logs nothing.
 *
 * @param ARG_sev
 *        See KEYSEQ_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See KEYSEQ_LOG_WITH_CHECKING().
 */
#define KEYSEQ_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  KEYSEQ_UTIL_SEMICOLON_SAFE \
  ( \
    ::keyseq::log::Logger* const KEYSEQ_LOG_WO_CHK_logger = get_logger(); \
    if (!KEYSEQ_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    const auto KEYSEQ_LOG_WO_CHK_when = ::std::chrono::system_clock::now(); \
    constexpr ::keyseq::util::String_view KEYSEQ_LOG_WO_CHK_file \
      = ::keyseq::util::file_basename(::keyseq::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    ::std::string KEYSEQ_LOG_WO_CHK_msg; \
    { \
      ::keyseq::util::String_appender KEYSEQ_LOG_WO_CHK_msg_os(&KEYSEQ_LOG_WO_CHK_msg); \
      KEYSEQ_LOG_WO_CHK_msg_os << ARG_stream_fragment; \
      KEYSEQ_LOG_WO_CHK_msg_os.flush(); \
    } \
    /* () around the initializer: it has commas. */ \
    ::keyseq::log::Msg_metadata KEYSEQ_LOG_WO_CHK_metadata \
      = (::keyseq::log::Msg_metadata{ get_log_component(), ARG_sev, KEYSEQ_LOG_WO_CHK_file, __LINE__, \
                                      __FUNCTION__, KEYSEQ_LOG_WO_CHK_when, \
                                      ::std::string(), ::keyseq::util::Thread_id() }); \
    ::keyseq::log::Logger::set_thread_info_in_msg_metadata(&KEYSEQ_LOG_WO_CHK_metadata); \
    KEYSEQ_LOG_WO_CHK_logger->do_log(&KEYSEQ_LOG_WO_CHK_metadata, KEYSEQ_LOG_WO_CHK_msg); \
  )

namespace keyseq::log
{
// Types.

/**
 * The component of a log message: an `enum` value plus the identity of its `enum` type, so that values of different
 * `enum`s never compare equal.  keyseq's own call sites use keyseq::Keyseq_log_component; user code may use any
 * `enum class` with underlying type #enum_raw_t.  A default-constructed Component is empty (no component).
 */
class Component
{
public:
  // Types.

  /// Required underlying type of a payload `enum`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding the given value.
   *
   * @tparam Payload
   *         `enum class` with underlying type #enum_raw_t.
   * @param payload
   *        Value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether `*this` holds no value.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * Whether `*this` holds a value of `enum` type `Payload`.
   *
   * @tparam Payload
   *         `enum` type.
   * @return See above.  `false` if empty().
   */
  template<typename Payload>
  bool holds() const;

  /**
   * The value held, as a `Payload`.  Undefined behavior unless `holds<Payload>()`.
   *
   * @tparam Payload
   *         `enum` type.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * `typeid` of the `enum` type held.  Undefined behavior if empty().
   *
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * The value held, as an integer.  Undefined behavior if empty().
   *
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `typeid` of the payload type; null if empty().
  std::type_info const * m_payload_type_or_null;

  /// The payload as an integer; meaningless if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/// Everything a `KEYSEQ_LOG_...()` call site knows about a message, except the message text.
struct Msg_metadata
{
  // Types.

  /// Time stamp type.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component; from `get_log_component()` at the call site.
  Component m_msg_component;

  /// Severity.
  Sev m_msg_sev;

  /// Source file name, sans directory.  Points to static storage.
  util::String_view m_msg_src_file;

  /// Source line.
  unsigned int m_msg_src_line;

  /// Source function name.  Points to static storage.
  util::String_view m_msg_src_function;

  /// When the call site was reached.
  Time_stamp m_called_when;

  /// Nickname of the logging thread; empty if it has none, in which case #m_call_thread_id is set instead.
  std::string m_call_thread_nickname;

  /// ID of the logging thread, if #m_call_thread_nickname is empty.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Interface to which `KEYSEQ_LOG_...()` messages are sent.  should_log() filters; do_log() writes.  Both may be
 * called concurrently from several threads, so an implementation must synchronize internally.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Whether a message of the given severity and component would be logged.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Logs the message unconditionally.  Neither argument need stay valid after return.
   *
   * @param metadata
   *        Everything but the text.
   * @param msg
   *        The text; not necessarily NUL-terminated.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;

  /**
   * Sets the nickname logged in place of the current thread's ID, from now on; or, if empty, goes back to the ID.
   * Affects only the calling thread.
   *
   * @param thread_nickname
   *        Nickname or empty.
   * @param logger_ptr
   *        If not null, the change is logged to it at INFO severity.
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = 0);

  /**
   * Fills `m_call_thread_nickname` or `m_call_thread_id` of the given metadata for the current thread.
   *
   * @param msg_metadata
   *        Not null.
   */
  static void set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata);

private:
  // Data.

  /// Current thread's nickname; null if none.
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Holds a Logger pointer and a Component, exposing them as get_logger() and get_log_component() for the
 * `KEYSEQ_LOG_...()` macros.  Derive from it in any class that logs.  Copyable; moved-from becomes as if
 * default-constructed.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Holds the given Logger and an empty Component.
   *
   * @param logger
   *        Logger; may be null.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Holds the given Logger and a Component made from the given payload.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Logger; may be null.
   * @param component_payload
   *        Component value.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copies.
   *
   * @param src
   *        Source.
   */
  Log_context(const Log_context& src);

  /**
   * Takes over `src`'s values; `src` becomes as if default-constructed.
   *
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copies.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Takes over `src`'s values; `src` becomes as if default-constructed.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges values with `other`.
   *
   * @param other
   *        Other.
   */
  void swap(Log_context& other);

  /**
   * The Logger.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The Component.
   *
   * @return See above.
   */
  const Component& get_log_component() const;

protected:
  // Methods.

  /**
   * Replaces the Logger, keeping the Component.  For subclasses that get their Logger late, as after loading from
   * an archive.
   *
   * @param logger
   *        Logger; may be null.
   */
  void set_logger(Logger* logger);

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Payload type must be an enum.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "Payload enum underlying type must equal enum_raw_t.");
}

template<typename Payload>
bool Component::holds() const
{
  return m_payload_type_or_null && (*m_payload_type_or_null == typeid(Payload));
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace keyseq::log
