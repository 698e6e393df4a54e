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
#include "FrontendUnitTestSimulationFixture.h"

#include <lotctl/simulation/Simulator.h>
#include <lotctl/simulation/waveformFormats/VCDSink.h>
#include <lotctl/hlim/Circuit.h>
#include <lotctl/hlim/Node.h>

#include <boost/test/unit_test.hpp>

namespace lotctl {

BoostUnitTestSimulationFixture::BoostUnitTestSimulationFixture()
{
}

BoostUnitTestSimulationFixture::~BoostUnitTestSimulationFixture()
{
	// The waveform recorder and the simulator refer to the circuit, which is destroyed with the DesignScope.
	m_vcdSink.reset();
	m_simulator.reset();
}

void BoostUnitTestSimulationFixture::eval()
{
	prepRun();
	sim::UnitTestSimulationFixture::eval(design.getCircuit());
}

void BoostUnitTestSimulationFixture::runTicks(const hlim::Clock *clock, unsigned numTicks)
{
	prepRun();
	sim::UnitTestSimulationFixture::runTicks(design.getCircuit(), clock, numTicks);
}

void BoostUnitTestSimulationFixture::recordVCD(const std::string &filename)
{
	sim::UnitTestSimulationFixture::recordVCD(design.getCircuit(), filename);
}

void BoostUnitTestSimulationFixture::prepRun()
{
	if (m_vcdSink)
		return;

	const std::string &testName = boost::unit_test::framework::current_test_case().p_name;
	auto &testSuite = boost::unit_test::framework::master_test_suite();
	for (int i = 1; i < testSuite.argc; i++) {
		std::string_view arg(testSuite.argv[i]);
		if (arg == "--vcd")
			recordVCD(testName + ".vcd");
	}
}

ClockedTest::ClockedTest()
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(100'000'000);
	config.name = "clock";
	config.resetName = "reset";
	m_clock.emplace(config);
	m_clockScope.emplace(*m_clock);
}

}
