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

#include "SimulatorCallbacks.h"
#include "../hlim/SignalRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lotctl::hlim {
	class Circuit;
	class Clock;
}

namespace lotctl::sim {

	class Simulator;
	class VCDSink;

/**
 * @brief Base for unit tests that simulate a circuit.
 * @details Owns a ReferenceSimulator, collects warnings and failed asserts reported through the
 * simulator callbacks and fails the running Boost.Test case if any were reported.
 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture();
		~UnitTestSimulationFixture();

		/// Records all pins, named signals and registers of the circuit into a vcd file on the next power on.
		void recordVCD(hlim::Circuit &circuit, const std::string &filename);

		/// Compiles the circuit and powers it on.
		void eval(hlim::Circuit &circuit);
		/// Compiles the circuit, powers it on and runs it for the given number of cycles of the clock.
		void runTicks(hlim::Circuit &circuit, const hlim::Clock *clock, unsigned numTicks);
		/// Continues a powered on simulation for the given number of cycles of the clock.
		void runCycles(const hlim::Clock *clock, size_t numCycles);

		void setInput(hlim::SignalRef pin, std::uint64_t value);
		std::uint64_t value(hlim::SignalRef signal) const;

		virtual void onDebugMessage(const hlim::BaseNode* src, std::string msg) override;
		virtual void onWarning(const hlim::BaseNode* src, std::string msg) override;
		virtual void onAssert(const hlim::BaseNode* src, std::string msg) override;

		Simulator& getSimulator() { return *m_simulator; }
		const std::vector<std::string> &getWarnings() const { return m_warnings; }
	protected:
		std::unique_ptr<Simulator> m_simulator;
		std::unique_ptr<VCDSink> m_vcdSink;

		std::vector<std::string> m_warnings;
		std::vector<std::string> m_errors;

		void checkMessages();
};

}
