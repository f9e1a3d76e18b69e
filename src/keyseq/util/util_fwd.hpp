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

#include "keyseq/util/string_view.hpp"
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <ostream>
#include <string>

/// Small general-purpose facilities shared by the other keyseq modules.
namespace keyseq::util
{
// Types.

class Null_interface;
class String_appender;

/// Thread ID as logged for threads without a nickname.
using Thread_id = boost::thread::id;

/// Non-recursive exclusive mutex, as used by the Logger implementations.
using Mutex_non_recursive = boost::mutex;

/**
 * RAII lock of a mutex such as #Mutex_non_recursive.
 *
 * @tparam Mutex
 *         Mutex type.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Appends to `*target_str` the result of `<<`ing each of the given arguments, in order, to an `ostream`.
 *
 * @tparam T
 *         Types such that `os << arg` works for an `std::ostream os`.
 * @param target_str
 *        String to append to.
 * @param ostream_args
 *        Zero or more things to write.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Same as ostream_op_to_string() but into a new string, returned.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The string.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * `<<`s each argument to `*os`, in order.  With no arguments, does nothing.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param os
 *        Stream.
 * @param ostream_args
 *        See ostream_op_to_string().
 */
template<typename ...T>
void feed_args_to_ostream(std::ostream* os, T const &... ostream_args);

/**
 * The part of a `/`-separated path past its last `/`; the whole path if there is none.  The result points into
 * `path`.
 *
 * @param path
 *        Path, typically `__FILE__`.  Build it with the pointer-and-length constructor from `sizeof(__FILE__) - 1`,
 *        so the whole thing can be evaluated at compile time.
 * @return See above.
 */
constexpr String_view file_basename(String_view path);

/**
 * `"<file>:<function>(<line>)"`, as used in log lines and exception contexts.
 *
 * @param file
 *        File name, already shortened if desired.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace keyseq::util

// Macros.

/**
 * Wraps the body of a multi-statement functional macro so that `MACRO(...);` is one statement.  The body may contain
 * commas only inside parentheses, as with any macro argument.
 *
 * @param ARG_func_macro_definition
 *        The statements.
 */
#define KEYSEQ_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

/// `std::string` `"<file>:<function>(<line>)"` for the invoking context; `<file>` is sans directory.
#define KEYSEQ_UTIL_WHERE_AM_I_STR() \
  ::keyseq::util::where_am_i_str(::keyseq::util::file_basename(::keyseq::util::String_view(__FILE__, \
                                                                                           sizeof(__FILE__) - 1)), \
                                 __FUNCTION__, __LINE__)

/**
 * String literal `"<file>:<function>(<line>)"` for the invoking context, with `<file>` the full `__FILE__` and
 * the function named explicitly.  Free at runtime.
 *
 * @param ARG_function
 *        Identifier of the invoking function, such as `add`.
 */
#define KEYSEQ_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" KEYSEQ_UTIL_STRINGIFY_VALUE(__LINE__) ")"

/// Stringifies the value of a macro (such as `__LINE__`), not its name.
#define KEYSEQ_UTIL_STRINGIFY_VALUE(ARG_val) \
  KEYSEQ_UTIL_STRINGIFY_LITERAL(ARG_val)

/// Helper for KEYSEQ_UTIL_STRINGIFY_VALUE().
#define KEYSEQ_UTIL_STRINGIFY_LITERAL(ARG_val) \
  #ARG_val
