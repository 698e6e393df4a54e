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

#include "DesignScope.h"
#include "Clock.h"

#include <lotctl/simulation/UnitTestSimulationFixture.h>

#include <optional>
#include <string>

namespace lotctl {

	/**
	 * @brief Helper class to facilitate writing unit tests
	 * @details Holds the design under test. Passing --vcd to the test executable records a waveform of every
	 * simulated test case, named after the test case.
	 */
	class BoostUnitTestSimulationFixture : public sim::UnitTestSimulationFixture
	{
		public:
			BoostUnitTestSimulationFixture();
			~BoostUnitTestSimulationFixture();

			/// Compiles the graph, powers it on and does one combinatory evaluation
			void eval();
			/// Compiles and runs the simulation for a specified amount of ticks (rising edges) of the given clock.
			void runTicks(const hlim::Clock *clock, unsigned numTicks);

			/// Enables recording of a waveform for a subsequent simulation run
			void recordVCD(const std::string &filename);

			DesignScope design;
		protected:
			virtual void prepRun();
	};

	/// Test fixture with an active 100 MHz clock scope named "clock".
	class ClockedTest : public BoostUnitTestSimulationFixture
	{
		public:
			ClockedTest();
			const Clock &clock() { return ClockScope::getClk(); }
			/// Runs the given number of cycles of the clock of the fixture.
			void cycles(size_t numCycles) { runCycles(clock().getClk(), numCycles); }
		private:
			std::optional<Clock> m_clock;
			std::optional<ClockScope> m_clockScope;
	};

}
