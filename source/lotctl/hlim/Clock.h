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

#include "../utils/CppTools.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

#include "ClockRational.h"
#include "SignalRef.h"

#include <string>
#include <vector>

namespace lotctl::hlim {

class DerivedClock;
class Circuit;

class Clock
{
	public:
		enum class TriggerEvent {
			RISING,
			FALLING
		};

		Clock();
		virtual ~Clock();

		virtual ClockRational absoluteFrequency() const = 0;
		/// @brief Returns false, if this clock is not driven by the simulator but by a logic signal.
		virtual bool isSelfDriven() const = 0;

		inline Clock *getParentClock() const { return m_parentClock; }

		inline const std::string &getName() const { return m_name; }
		inline const std::string &getResetName() const { return m_resetName; }
		inline const TriggerEvent &getTriggerEvent() const { return m_triggerEvent; }

		inline void setName(std::string name) { m_name = std::move(name); }
		inline void setResetName(std::string name) { m_resetName = std::move(name); }
		inline void setTriggerEvent(TriggerEvent trigEvt) { m_triggerEvent = trigEvt; }

		/// The input pin carrying the synchronous, active high reset of this clock domain.
		/// @details Derived clocks inherit the reset pin of their parent.
		SignalRef getResetSignal() const;
		void setResetSignal(SignalRef reset) { m_resetSignal = reset; }

		/// Returns true if the given edge of the clock signal triggers registers of this clock.
		bool isTriggeringEdge(bool risingEdge) const { return risingEdge == (m_triggerEvent == TriggerEvent::RISING); }

		/// Returns a unique ID for this clock that can be used as an index into containers.
		size_t getId() const { LOTCTL_ASSERT(m_id != ~0ull); return m_id; }
		void setId(std::uint64_t id, utils::RestrictTo<Circuit>) { m_id = id; }
	protected:
		size_t m_id = ~0ull;
		Clock *m_parentClock = nullptr;

		std::string m_name;
		std::string m_resetName;
		TriggerEvent m_triggerEvent = TriggerEvent::RISING;
		SignalRef m_resetSignal;
};

class RootClock : public Clock
{
	public:
		RootClock(std::string name, ClockRational frequency);

		virtual ClockRational absoluteFrequency() const override { return m_frequency; }
		virtual bool isSelfDriven() const override { return true; }
	protected:
		ClockRational m_frequency;
};

/**
 * @brief Clock whose clock signal is a 1-bit logic signal from within the parent clock domain.
 * @details The frequency multiplier is informative only (waveforms, logging), the simulator
 * derives the actual edges from the driving signal.
 */
class DerivedClock : public Clock
{
	public:
		DerivedClock(Clock *parentClock);

		virtual ClockRational absoluteFrequency() const override;
		virtual bool isSelfDriven() const override { return !m_logicClockDriver.valid(); }

		inline void setFrequencyMultiplier(ClockRational m) { m_parentRelativeMultiplicator = m; }

		/// @brief Binds a 1 bit logic signal to drive this clock.
		void setLogicClockDriver(SignalRef driver);
		inline SignalRef getLogicClockDriver() const { return m_logicClockDriver; }
	protected:
		ClockRational m_parentRelativeMultiplicator = 1;
		SignalRef m_logicClockDriver;
};

}
