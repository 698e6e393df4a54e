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
#include "ClockDivider.h"

#include <boost/format.hpp>

namespace lotctl::scl
{
	Node_ClockDivider::Node_ClockDivider(hlim::Clock *clock, std::uint64_t threshold) :
		hlim::BaseNode(0, NUM_OUTPUTS),
		m_threshold(threshold)
	{
		LOTCTL_ASSERT(clock != nullptr);
		attachClock(clock);
		setOutputWidth(OUT_COUNTER, utils::bitWidthFor(threshold));
		setOutputWidth(OUT_TICK, 1);
	}

	std::string Node_ClockDivider::getOutputName(size_t idx) const
	{
		switch (idx) {
			case OUT_COUNTER: return "counter";
			case OUT_TICK: return "tick";
			default: return {};
		}
	}

	void Node_ClockDivider::simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const
	{
		state.set(getOutput(OUT_COUNTER), 0);
		state.setBit(getOutput(OUT_TICK), false);
	}

	void Node_ClockDivider::simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const
	{
		const auto counter = getOutput(OUT_COUNTER);
		const auto tick = getOutput(OUT_TICK);

		if (resetAsserted(current)) {
			next.set(counter, 0);
			next.setBit(tick, false);
		} else if (current.get(counter) == m_threshold) {
			next.set(counter, 0);
			next.setBit(tick, !current.getBit(tick));
		} else
			next.set(counter, current.get(counter) + 1);
	}


	std::uint64_t ClockDivider::computeThreshold(hlim::ClockRational systemFrequency, hlim::ClockRational targetFrequency)
	{
		LOTCTL_DESIGNCHECK_HINT(targetFrequency.numerator() != 0, "The target frequency of a clock divider must not be zero.");

		std::uint64_t threshold = hlim::floor(systemFrequency / targetFrequency / std::uint64_t(2));
		LOTCTL_DESIGNCHECK_HINT(threshold > 0, "The target frequency of a clock divider must not exceed half the system frequency.");
		return threshold;
	}

	ClockDivider::ClockDivider(hlim::ClockRational targetFrequency)
	{
		Area area("ClockDivider");

		const Clock &systemClock = ClockScope::getClk();
		std::uint64_t threshold = computeThreshold(systemClock.absoluteFrequency(), targetFrequency);

		m_node = DesignScope::createNode<Node_ClockDivider>(systemClock.getClk(), threshold);
		m_node->setName("divider");

		auto *derived = DesignScope::createClock<hlim::DerivedClock>(systemClock.getClk());
		derived->setName(std::string(systemClock.name()) + "_divided");
		derived->setFrequencyMultiplier(hlim::ClockRational(1, 2 * (threshold + 1)));
		derived->setLogicClockDriver(tick());
		m_dividedClock.emplace(derived);

		dbg::log(dbg::LogMessage(area.getNodeGroup()) << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
			<< "Clock divider threshold is " << (size_t) threshold << ", the divided clock runs at "
			<< (boost::format("%g Hz") % hlim::toDouble(derived->absoluteFrequency())).str());
	}
}
