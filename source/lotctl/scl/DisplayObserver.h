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
#include <lotctl/simulation/SimulatorCallbacks.h>
#include <lotctl/hlim/SignalRef.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace lotctl::sim {
	class Simulator;
}

namespace lotctl::scl
{
	/**
	 * @brief Reconstructs the content of the multiplexed 4 digit display from its digit select and segment outputs.
	 * @details The digit encoder registers its pattern on the same tick that moves the digit select on, so a pattern
	 * belongs to the digit select that was active before the last change of the select. On every committed state
	 * the pattern is decoded into a glyph (the digit, ' ' for blank and '?' for a pattern that is not a digit) and
	 * stored for that position. Each position keeps the last glyph seen, like the persistence of vision of a
	 * physical display. Positions never lit show ' '.
	 */
	class DisplayObserver : public sim::SimulatorCallbacks
	{
	public:
		DisplayObserver(sim::Simulator &simulator, hlim::SignalRef digitSelect, hlim::SignalRef segments);

		virtual void onAfterPowerOn() override;
		virtual void onCommitState() override;

		/// The 4 glyphs, thousands digit first.
		std::string text() const;
		/// The glyph of a position, 0 is the units digit.
		char glyph(size_t position) const { return m_glyphs[position]; }
		/// Number of committed states in which the selected glyph changed.
		size_t updates() const { return m_updates; }
	protected:
		sim::Simulator &m_simulator;
		hlim::SignalRef m_digitSelect;
		hlim::SignalRef m_segments;

		std::uint64_t m_activeSelect = 0;
		std::optional<std::uint64_t> m_encodedSelect;
		std::array<char, 4> m_glyphs;
		size_t m_updates = 0;
	};
}
