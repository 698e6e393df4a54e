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
#include "DisplayMultiplexer.h"

namespace lotctl::scl
{
	Node_DisplayMultiplexer::Node_DisplayMultiplexer(hlim::Clock *clock) :
		hlim::BaseNode(0, NUM_OUTPUTS)
	{
		LOTCTL_ASSERT(clock != nullptr);
		attachClock(clock);
		setOutputWidth(OUT_DIGIT_INDEX, 2);
		setOutputWidth(OUT_DIGIT_SELECT, NUM_DIGITS);
	}

	std::string Node_DisplayMultiplexer::getOutputName(size_t idx) const
	{
		switch (idx) {
			case OUT_DIGIT_INDEX: return "digit_index";
			case OUT_DIGIT_SELECT: return "digit_select";
			default: return {};
		}
	}

	void Node_DisplayMultiplexer::writeResetState(sim::DataState &state) const
	{
		state.set(getOutput(OUT_DIGIT_INDEX), 0);
		state.set(getOutput(OUT_DIGIT_SELECT), digitSelectFor(0));
	}

	void Node_DisplayMultiplexer::simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const
	{
		writeResetState(state);
	}

	void Node_DisplayMultiplexer::simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const
	{
		if (resetAsserted(current)) {
			writeResetState(next);
			return;
		}

		std::uint64_t index = (current.get(getOutput(OUT_DIGIT_INDEX)) + 1) % NUM_DIGITS;
		next.set(getOutput(OUT_DIGIT_INDEX), index);
		next.set(getOutput(OUT_DIGIT_SELECT), digitSelectFor(index));
	}


	DisplayMultiplexer::DisplayMultiplexer()
	{
		Area area("DisplayMultiplexer");

		m_node = DesignScope::createNode<Node_DisplayMultiplexer>(ClockScope::getClk().getClk());
		m_node->setName("mux");
	}
}
