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
#include "Simulator.h"

namespace lotctl::sim {

void Simulator::CallbackDispatcher::onPowerOn() { forward(&SimulatorCallbacks::onPowerOn); }
void Simulator::CallbackDispatcher::onAfterPowerOn() { forward(&SimulatorCallbacks::onAfterPowerOn); }
void Simulator::CallbackDispatcher::onCommitState() { forward(&SimulatorCallbacks::onCommitState); }

void Simulator::CallbackDispatcher::onNewTick(const hlim::ClockRational &simulationTime)
{
	forward(&SimulatorCallbacks::onNewTick, simulationTime);
}

void Simulator::CallbackDispatcher::onClock(const hlim::Clock *clock, bool risingEdge)
{
	forward(&SimulatorCallbacks::onClock, clock, risingEdge);
}

void Simulator::CallbackDispatcher::onReset(const hlim::Clock *clock, bool resetAsserted)
{
	forward(&SimulatorCallbacks::onReset, clock, resetAsserted);
}

// Messages are passed by value, every receiver gets its own copy.
void Simulator::CallbackDispatcher::onDebugMessage(const hlim::BaseNode *src, std::string msg)
{
	forward(&SimulatorCallbacks::onDebugMessage, src, msg);
}

void Simulator::CallbackDispatcher::onWarning(const hlim::BaseNode *src, std::string msg)
{
	forward(&SimulatorCallbacks::onWarning, src, msg);
}

void Simulator::CallbackDispatcher::onAssert(const hlim::BaseNode *src, std::string msg)
{
	forward(&SimulatorCallbacks::onAssert, src, msg);
}

}
