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

#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <boost/unordered_map.hpp>

namespace msgcorr
{

// Types.

/// @cond
// -^- Doxygen, please ignore the following.  The real doc header for Log_component is in common.hpp.

/* Generate the `enum class Log_component` (and the matching name-map declaration) via `flow::log` macro magic.
 * The matching definitions are generated in common.cpp using the _cpp counterparts of the start/end headers. */
#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_MSGCORR_LOG_COMPONENT_NAME_MAP
#include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#include "msgcorr/detail/macros/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_hdr.macros.hpp>

// -v- Doxygen, please stop ignoring.
/// @endcond

} // namespace msgcorr
