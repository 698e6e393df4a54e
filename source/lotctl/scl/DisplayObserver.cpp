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
#include "DisplayObserver.h"
#include "SevenSegment.h"

#include <lotctl/simulation/Simulator.h>

namespace lotctl::scl
{
	DisplayObserver::DisplayObserver(sim::Simulator &simulator, hlim::SignalRef digitSelect, hlim::SignalRef segments) :
		m_simulator(simulator),
		m_digitSelect(digitSelect),
		m_segments(segments)
	{
		LOTCTL_DESIGNCHECK_HINT(digitSelect.width == 4, "The display observer expects a 4 bit digit select.");
		LOTCTL_DESIGNCHECK_HINT(segments.width == 7, "The display observer expects a 7 bit segment pattern.");
		m_glyphs.fill(' ');
		m_simulator.addCallbacks(this);
	}

	void DisplayObserver::onAfterPowerOn()
	{
		m_glyphs.fill(' ');
		m_updates = 0;
		m_activeSelect = m_simulator.getValueOfSignal(m_digitSelect);
		m_encodedSelect.reset();
	}

	void DisplayObserver::onCommitState()
	{
		std::uint64_t select = m_simulator.getValueOfSignal(m_digitSelect);
		if (select != m_activeSelect) {
			m_encodedSelect = m_activeSelect;
			m_activeSelect = select;
		}
		if (!m_encodedSelect)
			return;

		auto position = selectedPosition(*m_encodedSelect);
		if (!position)
			return;

		std::uint64_t pattern = m_simulator.getValueOfSignal(m_segments);
		char glyph;
		if (pattern == SEGMENTS_BLANK)
			glyph = ' ';
		else if (auto digit = decodeSegments(pattern))
			glyph = char('0' + *digit);
		else
			glyph = '?';

		if (m_glyphs[*position] != glyph) {
			m_glyphs[*position] = glyph;
			m_updates++;
		}
	}

	std::string DisplayObserver::text() const
	{
		return { m_glyphs.rbegin(), m_glyphs.rend() };
	}
}
