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
#include "msgcorr/util/util_fwd.hpp"

namespace msgcorr::util
{

// Implementations.

Fine_time_pt time_pt_after_saturated(const Fine_time_pt& from, const Fine_duration& span)
{
  assert((span >= Fine_duration::zero()) && "Broke contract.");

  // Fine_time_pt::max() - from cannot itself overflow as long as `from` is not before the epoch; Fine_clock's is not.
  if (span >= (Fine_time_pt::max() - from))
  {
    return Fine_time_pt::max();
  }
  // else
  return from + span;
}

} // namespace msgcorr::util
