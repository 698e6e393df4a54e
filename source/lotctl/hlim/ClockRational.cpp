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
#include "ClockRational.h"

#include <boost/format.hpp>

#include <array>

namespace lotctl::hlim {

void formatTime(std::ostream &stream, ClockRational time)
{
	struct Unit {
		const char *name;
		std::uint64_t perSecond;
	};
	static const std::array<Unit, 4> units = {{
		{ "s", 1ull },
		{ "ms", 1'000ull },
		{ "us", 1'000'000ull },
		{ "ns", 1'000'000'000ull },
	}};

	if (time.numerator() == 0) {
		stream << "0 s";
		return;
	}

	for (const auto &unit : units) {
		ClockRational scaled = time * ClockRational(unit.perSecond, 1);
		if (scaled.numerator() >= scaled.denominator()) {
			stream << boost::format("%g %s") % toDouble(scaled) % unit.name;
			return;
		}
	}

	ClockRational scaled = time * ClockRational(1'000'000'000'000ull, 1);
	stream << boost::format("%g ps") % toDouble(scaled);
}

}
