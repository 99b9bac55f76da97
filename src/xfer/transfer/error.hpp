/* Flow-Xfer: Core
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

#include "xfer/common.hpp"

/**
 * Namespace containing the xfer::transfer module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that most errors
 * xfer::transfer might report are system errors (from `read()`, `splice()`, etc.) and would not draw from this set
 * of codes/messages but rather from `boost::system::system_category()`.  That mixing is normal for boost.system.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace xfer::transfer::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by xfer::transfer functions/methods *outside of*
 * system-triggered errors such as `EPIPE` or `ENOSPC`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 *
 * Add new values at the end, but ahead of Code::S_END_SENTINEL.  Do not delete deprecated values.
 */
enum class Code
{
  /// User called an API with 1 or more invalid arguments (e.g., a null or closed endpoint).
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Destination accepted zero bytes of a non-empty write; the transfer cannot make progress.
  S_SHORT_WRITE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work; i.e., it lets one implicitly
 * convert from transfer::error::Code to #Error_code.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transfer::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If nothing is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "INVALID_ARGUMENT" (or "invalid_argument" or "Invalid_argument" or...) for Code::S_INVALID_ARGUMENT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transfer::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator; e.g., Code::S_SHORT_WRITE => `"SHORT_WRITE"`.  When printing an #Error_code storing a Code,
 * continue to print the #Error_code itself plus its `.message()`; this is for symbolic round-tripping (e.g., in
 * tests: "expect INVALID_ARGUMENT").
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace xfer::transfer::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::xfer::transfer::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
