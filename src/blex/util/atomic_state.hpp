/* BLE-Xact: Core
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

#include "blex/util/util_fwd.hpp"
#include <atomic>
#include <type_traits>

namespace blex::util
{

// Types.

/**
 * A lifecycle state cell holding one `Enum` value that can only be read or changed by compare-and-swap.
 * There is deliberately no store: every change must name the state it expects to replace, so that when several
 * threads race to make the same transition exactly one of them wins and the others learn that they lost.
 *
 * @tparam Enum
 *         An `enum` or `enum class` type.
 */
template<typename Enum>
class Atomic_state :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the cell holding `init`.
   *
   * @param init
   *        Initial state.
   */
  explicit Atomic_state(Enum init);

  // Methods.

  /**
   * Returns the current state.
   * @return See above.
   */
  Enum load() const;

  /**
   * Atomically replaces the state with `to` if and only if it currently equals `from`.
   *
   * @param from
   *        Expected current state.
   * @param to
   *        New state.
   * @return `true` if the transition was made by this call; `false` if the state was not `from`.
   */
  bool compare_exchange(Enum from, Enum to);

private:
  // Types.

  /// Short-hand for the integer stored.
  using raw_t = std::underlying_type_t<Enum>;

  // Data.

  /// The state.
  std::atomic<raw_t> m_raw;
}; // class Atomic_state

// Template implementations.

template<typename Enum>
Atomic_state<Enum>::Atomic_state(Enum init) :
  m_raw(static_cast<raw_t>(init))
{
  // That's it.
}

template<typename Enum>
Enum Atomic_state<Enum>::load() const
{
  return static_cast<Enum>(m_raw.load());
}

template<typename Enum>
bool Atomic_state<Enum>::compare_exchange(Enum from, Enum to)
{
  auto expected = static_cast<raw_t>(from);
  return m_raw.compare_exchange_strong(expected, static_cast<raw_t>(to));
}

} // namespace blex::util
