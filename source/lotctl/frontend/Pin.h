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

#include <string_view>

namespace lotctl {

/**
 * @addtogroup lotctl_frontend
 * @{
 */

	/// Declares an input pin of the design, driven by the simulator.
	hlim::SignalRef pinIn(std::string_view name, size_t width = 1);
	/// Exports a signal as an output pin of the design.
	void pinOut(hlim::SignalRef signal, std::string_view name);
	/// Gives a signal a name under which it shows up in waveforms and can be looked up.
	void setName(hlim::SignalRef signal, std::string_view name);

/// @}

}
