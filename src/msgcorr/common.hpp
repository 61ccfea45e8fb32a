/* Msg-Corr: Core
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

/* @todo More consistent to move this below `#include "msgcorr/..."`; but flow/common.hpp needs to #undef a couple
 * things before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*) for that to work.  It really should anyway. */
#include <flow/util/util.hpp>

#include "msgcorr/detail/common.hpp"

/* We build in C++17 mode ourselves, but linking user shouldn't care about that so much.
 * The APIs and header-inlined stuff (templates, constexprs), however, also require C++17 or newer; and that
 * applies to the linking user's `#include`ing .cpp file(s)!  Therefore enforce it by failing compile unless
 * compiler's C++17 or newer mode is in use. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any msgcorr/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Msg-Corr project: a library/API in modern C++17 providing per-peer message
 * correlation on top of a raw bidirectional transport.  Given two named endpoints (from, to) it keeps track of
 * out-messages awaiting transmission, correlates sent requests with their eventual responses by message ID,
 * applies per-message timeouts, and routes in-messages to a registered one-shot handler or a default handler.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in Msg-Corr: The absolute most basic, commonly used symbols (such as the alias
 *     msgcorr::Error_code).  There should be only a handful of these, and they are likely to be small.
 *     - In particular this includes `enum class` msgcorr::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of Msg-Corr.
 *   - Sub-namespaces, each of which represents a Msg-Corr *module* providing certain grouped functionality:
 *     - *msgcorr::session*: the point of the library.  session::Session is the per-endpoint-pair correlation
 *       state; session::Session_factory is the only way to obtain one.  session::Timeout_sweeper and
 *       session::Session_driver are helpers for whoever drives the actual transport.
 *     - *msgcorr::util*: Miscellaneous items used by the other modules.
 *
 * What Msg-Corr does *not* do: move bytes.  Actual transport, connection establishment, message serialization,
 * and authentication belong to the user's transport layer, which calls into a session::Session (to pull
 * out-messages and to deliver in-messages and transport errors) and is called by nothing here.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Msg-Corr requires Flow and Boost, not only for internal implementation purposes but also in some of its APIs.
 * For example, `flow::log` is the assumed logging system, and `flow::Error_code` and related conventions are used
 * for error reporting.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore, see the
 * `namespace flow` doc header's "Error reporting" section.  It applies verbatim (within reason) here.
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  We are just a consumer, but this does mean
 * the Msg-Corr user must supply a `flow::log::Logger` into various APIs in order to enable logging.  (Worst-case,
 * passing `Logger == null` will make it log nowhere.)  See `flow::log` docs.
 */
namespace msgcorr
{

// Types.  They're outside of `namespace ::msgcorr::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef MSGCORR_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Msg-Corr internal
 * logging.  Internal Msg-Corr code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  Msg-Corr user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are generated by `flow::log` macro magic; find them in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in msgcorr::Log_component to its
 * string representation as used in log output and verbosity config.
 *
 * @see msgcorr::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_MSGCORR_LOG_COMPONENT_NAME_MAP;

#endif // MSGCORR_DOXYGEN_ONLY

} // namespace msgcorr
