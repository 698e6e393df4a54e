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
#include <lotctl/frontend.h>

#include <cstdint>
#include <optional>

namespace lotctl::scl
{
	/**
	 * @brief Counter register and tick register of a clock divider.
	 * @details On every triggering edge: if reset, counter and tick become zero. Else if the counter reached the threshold,
	 * it wraps to zero and the tick inverts, otherwise the counter increments. The tick thus has a period of
	 * 2 * (threshold + 1) cycles with a 50% duty cycle.
	 */
	class Node_ClockDivider : public hlim::BaseNode
	{
	public:
		enum Outputs {
			OUT_COUNTER,
			OUT_TICK,
			NUM_OUTPUTS
		};

		Node_ClockDivider(hlim::Clock *clock, std::uint64_t threshold);

		virtual std::string getTypeName() const override { return "ClockDivider"; }
		virtual std::string getInputName(size_t idx) const override { return {}; }
		virtual std::string getOutputName(size_t idx) const override;

		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const override;

		std::uint64_t getThreshold() const { return m_threshold; }
	protected:
		std::uint64_t m_threshold;
	};

	/**
	 * @brief Derives a slow clock from the clock of the current ClockScope.
	 * @details The tick register drives a derived clock whose rising edges clock the slow domain.
	 */
	class ClockDivider
	{
	public:
		ClockDivider(hlim::ClockRational targetFrequency);

		/// floor(systemFrequency / targetFrequency / 2), throws a DesignError if the tick can not be produced.
		static std::uint64_t computeThreshold(hlim::ClockRational systemFrequency, hlim::ClockRational targetFrequency);

		inline std::uint64_t threshold() const { return m_node->getThreshold(); }
		inline hlim::SignalRef counter() const { return m_node->getOutput(Node_ClockDivider::OUT_COUNTER); }
		inline hlim::SignalRef tick() const { return m_node->getOutput(Node_ClockDivider::OUT_TICK); }
		inline const Clock &dividedClock() const { return *m_dividedClock; }
	private:
		Node_ClockDivider *m_node = nullptr;
		std::optional<Clock> m_dividedClock;
	};
}
