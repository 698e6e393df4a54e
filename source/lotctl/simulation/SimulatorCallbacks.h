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

#include "../hlim/ClockRational.h"

#include <string>

namespace lotctl::hlim {
	class Clock;
	class BaseNode;
}

namespace lotctl::sim {

/**
 * @brief Hooks through which waveform recorders, display observers and test benches follow a simulation.
 * @details All hooks default to doing nothing, observers only override what they need.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/// Power on begins, signal states are still undefined.
		virtual void onPowerOn() { }

		/// Power on is complete. Registers hold their reset values and combinatorics are settled.
		virtual void onAfterPowerOn() { }

		/**
		 * @brief The state of the current time step is final.
		 * @details Signal values may be read here. Recorders sample, observers decode.
		 */
		virtual void onCommitState() { }

		/// Simulation time moved to @p simulationTime. Clock edges of this time step follow.
		virtual void onNewTick(const hlim::ClockRational &simulationTime) { }

		/// A clock toggled. Every clock reports both edges, independent of its trigger edge.
		virtual void onClock(const hlim::Clock *clock, bool risingEdge) { }

		/// The reset pin of a root clock changed. Derived clocks are reset through their parent and never report.
		virtual void onReset(const hlim::Clock *clock, bool resetAsserted) { }

		virtual void onDebugMessage(const hlim::BaseNode *src, std::string msg) { }
		virtual void onWarning(const hlim::BaseNode *src, std::string msg) { }
		virtual void onAssert(const hlim::BaseNode *src, std::string msg) { }
};


/**
 * @brief Prints simulation events to stdout, used by the command line simulator for --trace.
 */
class SimulatorConsoleOutput : public SimulatorCallbacks
{
	public:
		virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
		virtual void onClock(const hlim::Clock *clock, bool risingEdge) override;
		virtual void onReset(const hlim::Clock *clock, bool resetAsserted) override;
		virtual void onDebugMessage(const hlim::BaseNode *src, std::string msg) override;
		virtual void onWarning(const hlim::BaseNode *src, std::string msg) override;
		virtual void onAssert(const hlim::BaseNode *src, std::string msg) override;

		/// Also print every clock edge (very verbose).
		SimulatorConsoleOutput &printClocks(bool enable) { m_printClocks = enable; return *this; }
	protected:
		hlim::ClockRational m_simTime;
		bool m_printClocks = false;

		void printNode(const hlim::BaseNode *src);
};

}
