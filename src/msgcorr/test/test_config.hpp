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

namespace msgcorr::test
{

/**
 * Process-wide settings for unit tests.  Environment variable `MSGCORR_TEST_LOG_SEV`, if set to a severity name
 * (e.g., `TRACE`), overrides the default #m_sev.
 */
class Test_config
{
public:
  // Methods.

  /**
   * The one Test_config.
   * @return See above.
   */
  static Test_config& get_singleton();

  /**
   * Registers Msg-Corr's and Flow's log components, with their names, in the given config.
   *
   * @param config
   *        Not null.
   */
  static void init_log_components(flow::log::Config* config);

  // Data.

  /// Lowest severity Test_logger passes through by default.
  flow::log::Sev m_sev;

private:
  // Constructors.

  /// Loads defaults, then the environment.
  Test_config();
}; // class Test_config

} // namespace msgcorr::test
