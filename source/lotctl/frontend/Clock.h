/*  This file is part of Lotctl, a cycle accurate model of a parking lot occupancy controller.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	Lotctl is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Lotctl is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "Scope.h"

#include "../hlim/Clock.h"
#include "../hlim/SignalRef.h"
#include "../utils/ConfigTree.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace lotctl {

/**
 * @addtogroup lotctl_frontend
 * @{
 */

	/// Parses frequencies ("100 MHz") and periods ("10 ns") into a frequency.
	hlim::ClockRational clockFromString(std::string text);

	class ClockConfig
	{
	public:
		using ClockRational = hlim::ClockRational;
		using TriggerEvent = hlim::Clock::TriggerEvent;

		void loadConfig(const utils::ConfigTree& config);

		std::optional<ClockRational> absoluteFrequency;
		std::optional<std::string> name;
		std::optional<std::string> resetName;
		std::optional<TriggerEvent> triggerEvent;
	};

	std::ostream& operator << (std::ostream&, const ClockConfig&);

	/**
	 * @brief Handle to a clock of the design.
	 * @details Constructing a clock from a ClockConfig creates a root clock, driven by the simulator, together with
	 * an input pin for its synchronous active high reset.
	 */
	class Clock
	{
		public:
			using ClockRational = hlim::ClockRational;
			using TriggerEvent = hlim::Clock::TriggerEvent;

			Clock(const ClockConfig &config);
			Clock(hlim::Clock *clock) : m_clock(clock) { }

			hlim::Clock *getClk() const { return m_clock; }
			hlim::ClockRational absoluteFrequency() const { return m_clock->absoluteFrequency(); }

			/// The reset pin, inherited from the parent for derived clocks.
			hlim::SignalRef resetSignal() const { return m_clock->getResetSignal(); }

			std::string_view name() const { return m_clock->getName(); }
			void setName(std::string name) { m_clock->setName(std::move(name)); }
		protected:
			hlim::Clock *m_clock = nullptr;
	};

	class ClockScope : public BaseScope<ClockScope>
	{
		public:
			ClockScope(const Clock clock) : m_clock(clock) { }
			static const Clock &getClk() {
				LOTCTL_DESIGNCHECK_HINT(m_currentScope != nullptr, "No clock scope active!");
				return m_currentScope->m_clock;
			}
		protected:
			const Clock m_clock;
	};

/// @}

}
