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

#include <compare>
#include <cstddef>
#include <ostream>

namespace lotctl::hlim {

/**
 * @brief Handle to one word of simulation state.
 * @details Every pin, register output, combinatorial output and every word of internal node state
 * is a signal of the circuit. The handle stores the index into the circuit's signal table and the width
 * so that state accesses can mask values without consulting the circuit.
 */
struct SignalRef
{
	size_t index = ~0ull;
	size_t width = 0;

	bool valid() const { return index != ~0ull; }

	auto operator<=>(const SignalRef&) const = default;
};

inline std::ostream &operator<<(std::ostream &stream, const SignalRef &sig)
{
	return stream << "signal#" << sig.index << '[' << sig.width << ']';
}

}
