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

#include "keyseq/util/util_fwd.hpp"
#include "keyseq/common.hpp"

/**
 * The exception and helpers behind keyseq's `Error_code* err_code` convention; see keyseq::Error_code.  A module X
 * with its own error codes keeps them in `keyseq::X::error`, as keyseq::collection::error does.
 */
namespace keyseq::error
{
// Types.

class Runtime_error;

// Free functions.

/**
 * The work of KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(), less what needs the preprocessor.  If `err_code` is not null,
 * returns `false` at once: the caller goes on to do its work.  Otherwise runs `*ret = func(&e_c)` for a local
 * Error_code `e_c`; throws Runtime_error if `e_c` ends up truthy; else returns `true`.
 *
 * @tparam Func
 *         Callable as `Ret(Error_code*)`.
 * @tparam Ret
 *         Result type.
 * @param func
 *        The operation; it is given a non-null `Error_code*`.
 * @param ret
 *        Where to put the result of `func`.
 * @param err_code
 *        The caller's `err_code`.
 * @param context
 *        Where the operation is, for the exception.
 * @return See above.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context);

} // namespace keyseq::error
