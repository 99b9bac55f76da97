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

/* @todo More consistent to move this below `#include "xfer/..."`; but flow/common.hpp needs to #undef a couple
 * things before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*) for that to work. */
#include <flow/util/util.hpp>

#include "xfer/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, and the header-inlined stuff (templates, `std::variant`-based results) requires
 * it of the `#include`ing translation unit too.  So enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any xfer/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Xfer project: a library/API in modern C++17 that moves bytes from one
 * open descriptor to another as fast as the kernel allows -- using `copy_file_range()`, `sendfile()`, or `splice()`
 * when the pair of descriptors permits -- while producing results indistinguishable from a plain `read()`/`write()`
 * loop.
 *
 * Modules overview
 * ----------------
 *   - *xfer::util*: Basic building blocks.  Most notably xfer::util::Native_handle, a trivial wrapper around
 *     an FD; and a few POSIX helpers (readiness waiting and the like).
 *     - Dependents: everything else.
 *   - *xfer::transfer*: The point of the library.  xfer::transfer::Endpoint classifies a caller-owned descriptor;
 *     xfer::transfer::Copier, given a destination and a source (possibly wrapped in a byte-limiting
 *     xfer::transfer::Limited_source), chooses among the accelerated *selectors* (xfer::transfer::Range_copy_selector,
 *     xfer::transfer::Send_file_selector, xfer::transfer::Splice_selector) and finally the generic
 *     xfer::transfer::buffered_copy() loop.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-Xfer requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the assumed logging system, and `flow::Error_code` and related conventions are used
 * for error reporting.  Coding style, error, logging and documentation conventions are those of Flow (and Flow-IPC).
 *
 * ### Error reporting ###
 * Inherited from Flow.  See the `namespace flow` doc header's "Error reporting" section.  In short: any API that
 * can fail takes a trailing `Error_code* err_code` (default null); if null, a `flow::error::Runtime_error` is thrown
 * on failure; else `*err_code` is set (cleared on success).
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  The user must supply a `flow::log::Logger`
 * into various APIs in order to enable logging.  (Passing `Logger == null` will make it log nowhere.)
 */
namespace xfer
{

// Types.  They're outside of `namespace ::xfer::util` for brevity due to their frequent use.

/**
 * @namespace xfer::fs
 * @brief Short-hand for `filesystem` namespace.  Same rationale as in Flow-IPC: boost.filesystem is rock-solid.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef XFER_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-Xfer internal
 * logging.  The actual members are generated by `flow::log` macro magic; see
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in xfer::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_XFER_LOG_COMPONENT_NAME_MAP;

#endif // XFER_DOXYGEN_ONLY

} // namespace xfer
