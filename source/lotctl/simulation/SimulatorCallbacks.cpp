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
#include "SimulatorCallbacks.h"

#include "../hlim/Clock.h"
#include "../hlim/Node.h"
#include "../hlim/NodeGroup.h"

#include <iostream>

namespace lotctl::sim {

void SimulatorConsoleOutput::onNewTick(const hlim::ClockRational &simulationTime)
{
	m_simTime = simulationTime;
}

void SimulatorConsoleOutput::onClock(const hlim::Clock *clock, bool risingEdge)
{
	if (!m_printClocks) return;

	hlim::formatTime(std::cout, m_simTime);
	std::cout << ": Clock " << clock->getName() << " has " << (risingEdge?"rising":"falling") << " edge." << std::endl;
}

void SimulatorConsoleOutput::onReset(const hlim::Clock *clock, bool resetAsserted)
{
	hlim::formatTime(std::cout, m_simTime);
	std::cout << ": Reset " << clock->getResetName() << (resetAsserted?" asserted.":" deasserted.") << std::endl;
}

void SimulatorConsoleOutput::printNode(const hlim::BaseNode *src)
{
	hlim::formatTime(std::cout, m_simTime);
	if (src != nullptr) {
		std::cout << " in " << src->getTypeName();
		if (src->getGroup() != nullptr)
			std::cout << " (" << src->getGroup()->instancePath() << ')';
	}
	std::cout << ": ";
}

void SimulatorConsoleOutput::onDebugMessage(const hlim::BaseNode *src, std::string msg)
{
	printNode(src);
	std::cout << msg << std::endl;
}

void SimulatorConsoleOutput::onWarning(const hlim::BaseNode *src, std::string msg)
{
	printNode(src);
	std::cout << "Warning: " << msg << std::endl;
}

void SimulatorConsoleOutput::onAssert(const hlim::BaseNode *src, std::string msg)
{
	printNode(src);
	std::cout << "Assertion failed: " << msg << std::endl;
}

}
