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

#include "../hlim/SignalRef.h"
#include "../utils/BitManipulation.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace lotctl::sim {

/**
 * @brief Holds the value of every signal of a circuit, one 64 bit word per signal.
 * @details Values are masked to the signal width on write. Copy assigning states of equal size does not allocate.
 */
class DataState
{
	public:
		void resize(size_t numSignals) { m_words.resize(numSignals); }
		void clear() { std::fill(m_words.begin(), m_words.end(), 0ull); }
		size_t size() const { return m_words.size(); }

		inline std::uint64_t get(hlim::SignalRef signal) const { return m_words[signal.index]; }
		inline bool getBit(hlim::SignalRef signal) const { return m_words[signal.index] & 1; }

		inline void set(hlim::SignalRef signal, std::uint64_t value) { m_words[signal.index] = value & utils::bitMaskRange<std::uint64_t>(0, signal.width); }
		inline void setBit(hlim::SignalRef signal, bool value) { m_words[signal.index] = value ? 1 : 0; }

		bool operator==(const DataState &other) const = default;
	protected:
		std::vector<std::uint64_t> m_words;
};

}
