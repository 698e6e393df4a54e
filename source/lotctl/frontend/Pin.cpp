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
#include "Pin.h"
#include "DesignScope.h"

namespace lotctl {

	hlim::SignalRef pinIn(std::string_view name, size_t width)
	{
		auto *design = DesignScope::get();
		LOTCTL_DESIGNCHECK_HINT(design != nullptr, "Pins can only be created inside a design scope.");
		auto &circuit = design->getCircuit();
		LOTCTL_DESIGNCHECK_HINT(!circuit.findSignal(name), "The pin name " + std::string(name) + " is already in use.");
		return circuit.createPinIn(name, width, GroupScope::getCurrentNodeGroup());
	}

	void pinOut(hlim::SignalRef signal, std::string_view name)
	{
		auto *design = DesignScope::get();
		LOTCTL_DESIGNCHECK_HINT(design != nullptr, "Pins can only be created inside a design scope.");
		design->getCircuit().addOutputPin(name, signal);
	}

	void setName(hlim::SignalRef signal, std::string_view name)
	{
		auto *design = DesignScope::get();
		LOTCTL_DESIGNCHECK_HINT(design != nullptr, "Signals can only be named inside a design scope.");
		design->getCircuit().nameSignal(signal, name);
	}

}
