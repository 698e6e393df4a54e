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
#include "lotctl/pch.h"
#include "OccupancyCounter.h"

#include <boost/format.hpp>

#include <algorithm>

namespace lotctl::scl
{
	Node_OccupancyCounter::Node_OccupancyCounter(hlim::Clock *clock, std::uint64_t capacity) :
		hlim::BaseNode(NUM_INPUTS, NUM_OUTPUTS),
		m_capacity(capacity)
	{
		LOTCTL_ASSERT(clock != nullptr);
		LOTCTL_DESIGNCHECK_HINT(capacity >= 1, "The capacity must be at least one.");
		attachClock(clock);
		setOutputWidth(OUT_COUNT, utils::bitWidthFor(capacity));
	}

	std::string Node_OccupancyCounter::getInputName(size_t idx) const
	{
		switch (idx) {
			case IN_ENTRY: return "entry";
			case IN_EXIT: return "exit";
			case IN_START: return "start";
			case IN_STOP: return "stop";
			case IN_MANUAL_VALUE: return "manual_value";
			case IN_MANUAL_ENABLE: return "manual_enable";
			default: return {};
		}
	}

	std::string Node_OccupancyCounter::getOutputName(size_t idx) const
	{
		switch (idx) {
			case OUT_COUNT: return "count";
			case OUT_OPEN: return "open";
			case OUT_FULL: return "full";
			case OUT_CLOSED: return "closed";
			default: return {};
		}
	}

	void Node_OccupancyCounter::writeResetState(sim::DataState &state) const
	{
		state.set(getOutput(OUT_COUNT), 0);
		state.setBit(getOutput(OUT_OPEN), true);
		state.setBit(getOutput(OUT_FULL), false);
		state.setBit(getOutput(OUT_CLOSED), false);
	}

	void Node_OccupancyCounter::simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const
	{
		writeResetState(state);
	}

	void Node_OccupancyCounter::simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const
	{
		if (resetAsserted(current)) {
			writeResetState(next);
			return;
		}

		const bool entry = current.getBit(getDriver(IN_ENTRY));
		const bool exit = current.getBit(getDriver(IN_EXIT));

		if (current.getBit(getDriver(IN_START)))
			next.setBit(getOutput(OUT_OPEN), true);
		else if (current.getBit(getDriver(IN_STOP)))
			next.setBit(getOutput(OUT_CLOSED), true);

		std::uint64_t count = current.get(getOutput(OUT_COUNT));
		const bool full = current.getBit(getOutput(OUT_FULL));

		if (entry && !exit) {
			if (!full)
				count++;
		} else if (exit && !entry) {
			if (count > 0)
				count--;
		} else if (!entry && !exit && current.getBit(getDriver(IN_MANUAL_ENABLE))) {
			std::uint64_t value = current.get(getDriver(IN_MANUAL_VALUE));
			if (value > m_capacity)
				simCallbacks.onDebugMessage(this, (boost::format("Manual value %d clamped to capacity %d") % value % m_capacity).str());
			count = std::min(value, m_capacity);
		}

		next.set(getOutput(OUT_COUNT), count);
		next.setBit(getOutput(OUT_FULL), count == m_capacity);
	}


	OccupancyCounter::OccupancyCounter(std::uint64_t capacity, const Inputs &inputs)
	{
		Area area("OccupancyCounter");

		m_node = DesignScope::createNode<Node_OccupancyCounter>(ClockScope::getClk().getClk(), capacity);
		m_node->setName("occupancy");
		m_node->connectInput(Node_OccupancyCounter::IN_ENTRY, inputs.entry);
		m_node->connectInput(Node_OccupancyCounter::IN_EXIT, inputs.exit);
		m_node->connectInput(Node_OccupancyCounter::IN_START, inputs.start);
		m_node->connectInput(Node_OccupancyCounter::IN_STOP, inputs.stop);
		m_node->connectInput(Node_OccupancyCounter::IN_MANUAL_VALUE, inputs.manualValue);
		m_node->connectInput(Node_OccupancyCounter::IN_MANUAL_ENABLE, inputs.manualEnable);
	}
}
