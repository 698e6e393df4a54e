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

namespace lotctl::scl
{
	/**
	 * @brief Count register and status flags of the parking lot.
	 * @details On every triggering edge, in priority order:
	 * - Reset: count 0, open, not full, not closed.
	 * - Start sets open, otherwise stop latches closed.
	 * - Independently, exactly one count transition: a lone entry increments unless full, a lone exit decrements
	 *   unless empty, with neither asserted manual enable loads min(manual value, capacity). Entry and exit
	 *   together change nothing. Any entry or exit shadows the manual load, even if it can not change the count.
	 * - Full is recomputed from the new count.
	 */
	class Node_OccupancyCounter : public hlim::BaseNode
	{
	public:
		enum Inputs {
			IN_ENTRY,
			IN_EXIT,
			IN_START,
			IN_STOP,
			IN_MANUAL_VALUE,
			IN_MANUAL_ENABLE,
			NUM_INPUTS
		};
		enum Outputs {
			OUT_COUNT,
			OUT_OPEN,
			OUT_FULL,
			OUT_CLOSED,
			NUM_OUTPUTS
		};

		Node_OccupancyCounter(hlim::Clock *clock, std::uint64_t capacity);

		virtual std::string getTypeName() const override { return "OccupancyCounter"; }
		virtual std::string getInputName(size_t idx) const override;
		virtual std::string getOutputName(size_t idx) const override;

		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const override;

		inline std::uint64_t getCapacity() const { return m_capacity; }
	protected:
		std::uint64_t m_capacity;

		void writeResetState(sim::DataState &state) const;
	};

	class OccupancyCounter
	{
	public:
		struct Inputs {
			hlim::SignalRef entry;
			hlim::SignalRef exit;
			hlim::SignalRef start;
			hlim::SignalRef stop;
			hlim::SignalRef manualValue;
			hlim::SignalRef manualEnable;
		};

		OccupancyCounter(std::uint64_t capacity, const Inputs &inputs);

		inline std::uint64_t capacity() const { return m_node->getCapacity(); }
		inline hlim::SignalRef count() const { return m_node->getOutput(Node_OccupancyCounter::OUT_COUNT); }
		inline hlim::SignalRef open() const { return m_node->getOutput(Node_OccupancyCounter::OUT_OPEN); }
		inline hlim::SignalRef full() const { return m_node->getOutput(Node_OccupancyCounter::OUT_FULL); }
		inline hlim::SignalRef closed() const { return m_node->getOutput(Node_OccupancyCounter::OUT_CLOSED); }
	private:
		Node_OccupancyCounter *m_node = nullptr;
	};
}
