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
	/// Active low one-hot digit select for a digit position (0 is the units digit).
	inline std::uint64_t digitSelectFor(size_t position) { return ~(1ull << position) & 0xF; }

	/**
	 * @brief Cycles the active digit of a 4-digit display.
	 * @details On every tick of its clock the active digit index advances by one (wrapping after 3) and the
	 * digit select is updated to the new index. A tick with reset asserted forces the index to 0 and the digit
	 * select to the first position without advancing. Registers power on in their reset state.
	 */
	class Node_DisplayMultiplexer : public hlim::BaseNode
	{
	public:
		enum Outputs {
			OUT_DIGIT_INDEX,
			OUT_DIGIT_SELECT,
			NUM_OUTPUTS
		};

		static constexpr size_t NUM_DIGITS = 4;

		Node_DisplayMultiplexer(hlim::Clock *clock);

		virtual std::string getTypeName() const override { return "DisplayMultiplexer"; }
		virtual std::string getInputName(size_t idx) const override { return {}; }
		virtual std::string getOutputName(size_t idx) const override;

		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const override;
	protected:
		void writeResetState(sim::DataState &state) const;
	};

	/// Display multiplexer in the clock domain of the current ClockScope.
	class DisplayMultiplexer
	{
	public:
		DisplayMultiplexer();

		inline hlim::SignalRef digitIndex() const { return m_node->getOutput(Node_DisplayMultiplexer::OUT_DIGIT_INDEX); }
		inline hlim::SignalRef digitSelect() const { return m_node->getOutput(Node_DisplayMultiplexer::OUT_DIGIT_SELECT); }
	private:
		Node_DisplayMultiplexer *m_node = nullptr;
	};
}
