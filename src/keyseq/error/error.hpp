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

#include "keyseq/error/error_fwd.hpp"
#include "keyseq/log/log.hpp"
#include <boost/system/system_error.hpp>
#include <string>

namespace keyseq::error
{
// Types.

/**
 * What keyseq throws when a null `err_code` was passed and the operation failed: a boost.system `system_error`
 * whose what() reads `<context>: <message> [<category>:<value>]`; or, with no (truthy) code, just `<context>`.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code_or_success
   *        The error; or success if there is no code for it.
   * @param context
   *        Where it happened, as from KEYSEQ_UTIL_WHERE_AM_I_LITERAL().
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Same as `Runtime_error(Error_code(), context)`.
   *
   * @param context
   *        See other constructor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * See class doc header.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// The what() string.
  const std::string m_what;
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code our_err_code;
  *ret = func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

} // namespace keyseq::error

// Macros.

/**
 * Sets `*err_code` to the given code and logs it at WARNING severity.  Needs a non-null `Error_code* err_code` in
 * scope, and `get_logger()` and `get_log_component()` as for `KEYSEQ_LOG_...()`.
 *
 * @param ARG_val
 *        Anything convertible to keyseq::Error_code, such as a keyseq::collection::error::Code.
 */
#define KEYSEQ_ERROR_EMIT_ERROR(ARG_val) \
  KEYSEQ_UTIL_SEMICOLON_SAFE \
  ( \
    const ::keyseq::Error_code KEYSEQ_ERROR_EMIT_ERR_val(ARG_val); \
    KEYSEQ_LOG_WARNING("Error code emitted: [" << KEYSEQ_ERROR_EMIT_ERR_val << "] " \
                       "[" << KEYSEQ_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = KEYSEQ_ERROR_EMIT_ERR_val; \
  )

/**
 * Gives a method taking a trailing `Error_code* err_code` its throw-on-null behavior.  Place it first in the body:
 *
 *   ~~~
 *   bool Dedupe_column_collection<Item>::add(const Item_ptr& item, Error_code* err_code)
 *   {
 *     KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, _1);
 *     // From here on err_code is not null.
 *     ...
 *   ~~~
 *
 * With a null `err_code` the method calls itself with a local one (`_1`), throws Runtime_error if that comes back
 * truthy, and else returns the result.  With a non-null one, this does nothing.
 *
 * @param ARG_ret_type
 *        The method's return type; default-constructible and copyable.
 * @param ARG_function_name
 *        The method's name, for the recursive call.
 * @param ...
 *        The recursive call's arguments, with `_1` for `err_code`.
 */
#define KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  KEYSEQ_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type KEYSEQ_ERROR_EXEC_result; \
    if (::keyseq::error::exec_and_throw_on_error \
          ([&](::keyseq::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &KEYSEQ_ERROR_EXEC_result, err_code, KEYSEQ_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return KEYSEQ_ERROR_EXEC_result; \
    } \
  )
