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
#include "SevenSegment.h"

#include "../utils/Range.h"

namespace lotctl::scl
{
	std::uint8_t encodeDigit(std::uint64_t digit)
	{
		if (digit >= SEGMENT_TABLE.size())
			return SEGMENTS_BLANK;
		return SEGMENT_TABLE[digit];
	}

	std::optional<std::uint8_t> decodeSegments(std::uint64_t segments)
	{
		for (auto i : utils::Range(SEGMENT_TABLE.size()))
			if (SEGMENT_TABLE[i] == segments)
				return (std::uint8_t) i;
		return {};
	}

	std::optional<size_t> selectedPosition(std::uint64_t digitSelect)
	{
		switch (digitSelect) {
			case 0xE: return 0;
			case 0xD: return 1;
			case 0xB: return 2;
			case 0x7: return 3;
			default: return {};
		}
	}

	std::uint64_t selectDigit(std::uint64_t digitSelect, std::uint64_t value)
	{
		static const std::array<std::uint64_t, 4> powersOfTen = { 1, 10, 100, 1000 };

		auto position = selectedPosition(digitSelect);
		if (!position)
			return 0;
		return value / powersOfTen[*position] % 10;
	}


	Node_DigitEncoder::Node_DigitEncoder(hlim::Clock *clock) :
		hlim::BaseNode(NUM_INPUTS, NUM_OUTPUTS)
	{
		LOTCTL_ASSERT(clock != nullptr);
		attachClock(clock);
		setOutputWidth(OUT_SEGMENTS, 7);
	}

	std::string Node_DigitEncoder::getInputName(size_t idx) const
	{
		switch (idx) {
			case IN_DIGIT_SELECT: return "digit_select";
			case IN_VALUE: return "value";
			default: return {};
		}
	}

	void Node_DigitEncoder::simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const
	{
		state.set(getOutput(OUT_SEGMENTS), SEGMENTS_BLANK);
	}

	void Node_DigitEncoder::simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const
	{
		if (resetAsserted(current)) {
			next.set(getOutput(OUT_SEGMENTS), SEGMENTS_BLANK);
			return;
		}

		std::uint64_t digit = selectDigit(current.get(getDriver(IN_DIGIT_SELECT)), current.get(getDriver(IN_VALUE)));
		next.set(getOutput(OUT_SEGMENTS), encodeDigit(digit));
	}


	DigitEncoder::DigitEncoder(hlim::SignalRef digitSelect, hlim::SignalRef value)
	{
		Area area("DigitEncoder");

		LOTCTL_DESIGNCHECK_HINT(digitSelect.width == 4, "The digit select of a 4 digit display is 4 bits wide.");

		m_node = DesignScope::createNode<Node_DigitEncoder>(ClockScope::getClk().getClk());
		m_node->setName("encoder");
		m_node->connectInput(Node_DigitEncoder::IN_DIGIT_SELECT, digitSelect);
		m_node->connectInput(Node_DigitEncoder::IN_VALUE, value);
	}
}
