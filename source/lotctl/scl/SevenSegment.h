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

#include <array>
#include <cstdint>
#include <optional>

namespace lotctl::scl
{
	/// Active low pattern with all segments off.
	constexpr std::uint8_t SEGMENTS_BLANK = 0x7F;

	/// Active low 7-segment patterns of the decimal digits, bit 6 is segment a and bit 0 is segment g.
	constexpr std::array<std::uint8_t, 10> SEGMENT_TABLE = {
		0x01, 0x4F, 0x12, 0x06, 0x4C, 0x24, 0x20, 0x0F, 0x00, 0x04
	};

	/// Segment pattern of a digit, anything outside 0 to 9 is blank.
	std::uint8_t encodeDigit(std::uint64_t digit);
	/// Digit shown by a segment pattern, or nothing if the pattern is not a digit (this includes blank).
	std::optional<std::uint8_t> decodeSegments(std::uint64_t segments);

	/// Position (0 is the units digit) selected by an active low one-hot digit select.
	std::optional<size_t> selectedPosition(std::uint64_t digitSelect);
	/// Decimal digit of the value at the selected position, 0 for unrecognized selects.
	std::uint64_t selectDigit(std::uint64_t digitSelect, std::uint64_t value);

	/**
	 * @brief Registered lookup of the segment pattern of the selected digit of a value.
	 * @details Runs on the display tick next to the multiplexer. On every tick it reads the pre-edge digit select
	 * and value, so the pattern it produces belongs to the position that was selected before the tick. A tick with
	 * reset asserted blanks the pattern for that tick only. Powers on blank.
	 */
	class Node_DigitEncoder : public hlim::BaseNode
	{
	public:
		enum Inputs {
			IN_DIGIT_SELECT,
			IN_VALUE,
			NUM_INPUTS
		};
		enum Outputs {
			OUT_SEGMENTS,
			NUM_OUTPUTS
		};

		Node_DigitEncoder(hlim::Clock *clock);

		virtual std::string getTypeName() const override { return "DigitEncoder"; }
		virtual std::string getInputName(size_t idx) const override;
		virtual std::string getOutputName(size_t idx) const override { return "segments"; }

		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const override;
	};

	/// Digit encoder in the clock domain of the current ClockScope.
	class DigitEncoder
	{
	public:
		DigitEncoder(hlim::SignalRef digitSelect, hlim::SignalRef value);

		inline hlim::SignalRef segments() const { return m_node->getOutput(Node_DigitEncoder::OUT_SEGMENTS); }
	private:
		Node_DigitEncoder *m_node = nullptr;
	};
}
