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
#include "UnitTestSimulationFixture.h"

#include "ReferenceSimulator.h"
#include "waveformFormats/VCDSink.h"

#include <boost/test/unit_test.hpp>

#include "../hlim/Circuit.h"

namespace lotctl::sim {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	m_simulator.reset(new ReferenceSimulator());
	m_simulator->addCallbacks(this);
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
}

void UnitTestSimulationFixture::recordVCD(hlim::Circuit &circuit, const std::string &filename)
{
	LOTCTL_ASSERT_HINT(!m_vcdSink, "Only one vcd file can be recorded per simulation.");
	m_vcdSink.reset(new VCDSink(circuit, *m_simulator, filename.c_str()));
	m_vcdSink->addAllPins();
	m_vcdSink->addAllNamedSignals();
	m_vcdSink->addAllSignals();
}

void UnitTestSimulationFixture::eval(hlim::Circuit &circuit)
{
	m_simulator->compileProgram(circuit);
	m_simulator->powerOn();
	m_simulator->commitState();

	checkMessages();
}

void UnitTestSimulationFixture::runTicks(hlim::Circuit &circuit, const hlim::Clock *clock, unsigned numTicks)
{
	m_simulator->compileProgram(circuit);
	m_simulator->powerOn();
	m_simulator->advanceCycles(clock, numTicks);

	checkMessages();
}

void UnitTestSimulationFixture::runCycles(const hlim::Clock *clock, size_t numCycles)
{
	m_simulator->advanceCycles(clock, numCycles);

	checkMessages();
}

void UnitTestSimulationFixture::setInput(hlim::SignalRef pin, std::uint64_t value)
{
	m_simulator->setInputPin(pin, value);
}

std::uint64_t UnitTestSimulationFixture::value(hlim::SignalRef signal) const
{
	return m_simulator->getValueOfSignal(signal);
}

void UnitTestSimulationFixture::checkMessages()
{
	if (!m_errors.empty())
		BOOST_FAIL(m_errors.front());
	if (!m_warnings.empty())
		BOOST_ERROR(m_warnings.front());
}

void UnitTestSimulationFixture::onDebugMessage(const hlim::BaseNode *src, std::string msg)
{
	BOOST_TEST_MESSAGE(msg);
}

void UnitTestSimulationFixture::onWarning(const hlim::BaseNode *src, std::string msg)
{
	m_warnings.push_back(msg);
}

void UnitTestSimulationFixture::onAssert(const hlim::BaseNode *src, std::string msg)
{
	m_errors.push_back(msg);
}

}
