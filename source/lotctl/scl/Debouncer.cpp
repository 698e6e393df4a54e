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
#include "Debouncer.h"

#include <algorithm>

namespace lotctl::scl
{
	ShiftRegisterFilter::ShiftRegisterFilter(size_t samples) : m_samples(samples)
	{
		LOTCTL_DESIGNCHECK_HINT(samples >= 1, "A debounce filter needs to see at least one sample before reporting a level.");
		LOTCTL_DESIGNCHECK_HINT(samples <= 63, "The shift register debounce filter supports at most 63 samples.");
	}

	std::uint64_t ShiftRegisterFilter::advance(std::uint64_t state, bool rawSample) const
	{
		const std::uint64_t allSet = utils::bitMaskRange<std::uint64_t>(0, m_samples);

		std::uint64_t history = state >> 1;
		history = ((history << 1) | (rawSample ? 1 : 0)) & allSet;
		bool newLevel = level(state);
		if (history == allSet)
			newLevel = true;
		else if (history == 0)
			newLevel = false;

		return (history << 1) | (newLevel ? 1 : 0);
	}


	IntegratorFilter::IntegratorFilter(std::uint64_t threshold) : m_threshold(threshold)
	{
		LOTCTL_DESIGNCHECK_HINT(threshold >= 1, "A debounce filter needs to see at least one sample before reporting a level.");
		LOTCTL_DESIGNCHECK_HINT(threshold < (1ull << 62), "Integrator threshold too large.");
	}

	std::uint64_t IntegratorFilter::advance(std::uint64_t state, bool rawSample) const
	{
		std::uint64_t integrator = state >> 1;
		if (rawSample)
			integrator = std::min(integrator + 1, m_threshold);
		else if (integrator > 0)
			integrator--;

		bool newLevel = level(state);
		if (integrator == m_threshold)
			newLevel = true;
		else if (integrator == 0)
			newLevel = false;

		return (integrator << 1) | (newLevel ? 1 : 0);
	}


	Node_Debouncer::Node_Debouncer(hlim::Clock *clock, std::unique_ptr<DebounceFilter> filter, OutputMode mode) :
		hlim::BaseNode(NUM_INPUTS, NUM_OUTPUTS),
		m_filter(std::move(filter)),
		m_mode(mode)
	{
		LOTCTL_ASSERT(clock != nullptr);
		LOTCTL_DESIGNCHECK_HINT(m_filter != nullptr, "Debouncers need a filter.");
		LOTCTL_DESIGNCHECK_HINT(m_filter->stateWidth() <= 64, "The filter state must fit into 64 bits.");
		attachClock(clock);
	}

	void Node_Debouncer::simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const
	{
		state.set(getInternal(INT_FILTER_STATE), m_filter->powerOnState());
		state.setBit(getOutput(OUT_OUTPUT), false);
	}

	void Node_Debouncer::simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const
	{
		const auto filterState = getInternal(INT_FILTER_STATE);
		const auto output = getOutput(OUT_OUTPUT);

		if (resetAsserted(current)) {
			next.set(filterState, m_filter->powerOnState());
			next.setBit(output, false);
			return;
		}

		std::uint64_t oldState = current.get(filterState);
		std::uint64_t newState = m_filter->advance(oldState, current.getBit(getDriver(IN_RAW)));
		next.set(filterState, newState);

		switch (m_mode) {
			case OutputMode::LEVEL:
				next.setBit(output, m_filter->level(newState));
			break;
			case OutputMode::PRESS_PULSE:
				next.setBit(output, m_filter->level(newState) && !m_filter->level(oldState));
			break;
		}
	}


	Debouncer::Debouncer(std::string_view name, hlim::SignalRef raw, std::unique_ptr<DebounceFilter> filter, OutputMode mode)
	{
		Area area(name);

		LOTCTL_DESIGNCHECK_HINT(raw.width == 1, "Debouncers filter single bit signals.");

		m_node = DesignScope::createNode<Node_Debouncer>(ClockScope::getClk().getClk(), std::move(filter), mode);
		m_node->setName(std::string(name));
		m_node->connectInput(Node_Debouncer::IN_RAW, raw);
	}
}
