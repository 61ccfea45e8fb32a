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

#include "msgcorr/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>

/**
 * Msg-Corr module containing miscellaneous general-use facilities that are used by other Msg-Corr modules
 * and/or do not fit into any other Msg-Corr module.
 *
 * Mostly these are short-hands for Flow types, so that Msg-Corr APIs can speak of time points and string views
 * without spelling out `flow::` every time.
 */
namespace msgcorr::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_clock`: the monotonic high-resolution clock used for all deadlines.
using Fine_clock = flow::Fine_clock;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

// Free functions.

/**
 * Returns `from + span`, except that if the result would not be representable it returns
 * `Fine_time_pt::max()` instead.  This lets a caller express "effectively never" as `Fine_duration::max()`
 * without the addition wrapping around into the past.
 *
 * @param from
 *        Starting point.
 * @param span
 *        Non-negative duration or undefined behavior (assertion may trip).
 * @return See above.
 */
Fine_time_pt time_pt_after_saturated(const Fine_time_pt& from, const Fine_duration& span);

} // namespace msgcorr::util
