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
#include "pch.h"
#include "TestNodes.h"

#include <lotctl/simulation/ReferenceSimulator.h>

#include <boost/test/unit_test.hpp>

using namespace lotctl;

BOOST_AUTO_TEST_SUITE(Simulation)

BOOST_FIXTURE_TEST_CASE(RootClockEdges, BoostUnitTestSimulationFixture)
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000);
	Clock clock(config);

	hlim::SignalRef counter = test::buildCounter(clock.getClk(), 8, "counter");

	runTicks(clock.getClk(), 5);

	BOOST_TEST(value(counter) == 5);
	BOOST_TEST(getSimulator().getClockCycles(clock.getClk()) == 5);
	// First rising edge after half a period
	BOOST_TEST(getSimulator().getCurrentSimulationTime() == hlim::ClockRational(9, 2'000));
	BOOST_TEST(getSimulator().getValueOfClock(clock.getClk()) == true);
}

BOOST_FIXTURE_TEST_CASE(RegistersPowerOnInResetState, BoostUnitTestSimulationFixture)
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000);
	Clock clock(config);

	auto *reg = DesignScope::createNode<test::Node_TestRegister>(clock.getClk(), 5, 4);
	auto *inc = DesignScope::createNode<test::Node_TestIncrement>(4);
	inc->connectInput(0, reg->getOutput(0));
	reg->connectInput(0, inc->getOutput(0));

	eval();
	BOOST_TEST(value(reg->getOutput(0)) == 5);
	BOOST_TEST(value(inc->getOutput(0)) == 6);
	BOOST_TEST(getSimulator().getValueOfReset(clock.getClk()) == false);
}

BOOST_FIXTURE_TEST_CASE(RegistersSampleThePreEdgeState, BoostUnitTestSimulationFixture)
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000);
	Clock clock(config);

	auto *a = DesignScope::createNode<test::Node_TestRegister>(clock.getClk(), 1, 1);
	auto *b = DesignScope::createNode<test::Node_TestRegister>(clock.getClk(), 0, 1);
	a->connectInput(0, b->getOutput(0));
	b->connectInput(0, a->getOutput(0));

	runTicks(clock.getClk(), 1);
	BOOST_TEST(value(a->getOutput(0)) == 0);
	BOOST_TEST(value(b->getOutput(0)) == 1);

	runCycles(clock.getClk(), 2);
	BOOST_TEST(value(a->getOutput(0)) == 0);
	BOOST_TEST(value(b->getOutput(0)) == 1);

	runCycles(clock.getClk(), 1);
	BOOST_TEST(value(a->getOutput(0)) == 1);
	BOOST_TEST(value(b->getOutput(0)) == 0);
}

BOOST_FIXTURE_TEST_CASE(SynchronousReset, ClockedTest)
{
	hlim::SignalRef counter = test::buildCounter(clock().getClk(), 8, "counter");
	hlim::SignalRef reset = clock().resetSignal();
	BOOST_TEST(design.getCircuit().getSignal(reset).name == "reset");

	runTicks(clock().getClk(), 3);
	BOOST_TEST(value(counter) == 3);

	setInput(reset, 1);
	BOOST_TEST(value(counter) == 3);
	BOOST_TEST(getSimulator().getValueOfReset(clock().getClk()) == true);

	cycles(1);
	BOOST_TEST(value(counter) == 0);
	cycles(2);
	BOOST_TEST(value(counter) == 0);

	setInput(reset, 0);
	cycles(2);
	BOOST_TEST(value(counter) == 2);
}

BOOST_FIXTURE_TEST_CASE(DerivedClockFollowsItsDriver, BoostUnitTestSimulationFixture)
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000);
	Clock clock(config);

	hlim::SignalRef toggle = test::buildToggle(clock.getClk(), "toggle");

	auto *derived = DesignScope::createClock<hlim::DerivedClock>(clock.getClk());
	derived->setFrequencyMultiplier(hlim::ClockRational(1, 2));
	derived->setLogicClockDriver(toggle);
	BOOST_TEST(derived->getName() == "clock_derived");
	BOOST_TEST(derived->absoluteFrequency() == hlim::ClockRational(500));
	BOOST_TEST(derived->getResetSignal() == clock.resetSignal());

	hlim::SignalRef slowCounter = test::buildCounter(derived, 8, "slow_counter");

	runTicks(clock.getClk(), 8);

	BOOST_TEST(getSimulator().getClockCycles(derived) == 4);
	BOOST_TEST(value(slowCounter) == 4);
	// The toggle rose on the 7th and fell on the 8th edge
	BOOST_TEST(getSimulator().getValueOfClock(derived) == false);
}

BOOST_FIXTURE_TEST_CASE(DerivedClockWithoutDriverIsRejected, BoostUnitTestSimulationFixture)
{
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000);
	Clock clock(config);

	auto *derived = DesignScope::createClock<hlim::DerivedClock>(clock.getClk());
	test::buildCounter(derived, 8, "slow_counter");

	BOOST_CHECK_THROW(eval(), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(CombinatorialLoopIsRejected, BoostUnitTestSimulationFixture)
{
	auto *a = DesignScope::createNode<test::Node_TestIncrement>(4);
	auto *b = DesignScope::createNode<test::Node_TestIncrement>(4);
	a->connectInput(0, b->getOutput(0));
	b->connectInput(0, a->getOutput(0));

	BOOST_CHECK_THROW(eval(), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(UnconnectedInputIsRejected, ClockedTest)
{
	DesignScope::createNode<test::Node_TestRegister>(clock().getClk(), 0, 1);

	BOOST_CHECK_THROW(eval(), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(CombinatorialNodesAreSorted, BoostUnitTestSimulationFixture)
{
	hlim::SignalRef in = pinIn("in", 8);
	// Created in reverse order of evaluation
	auto *last = DesignScope::createNode<test::Node_TestIncrement>(8);
	auto *middle = DesignScope::createNode<test::Node_TestIncrement>(8);
	auto *first = DesignScope::createNode<test::Node_TestIncrement>(8);
	first->connectInput(0, in);
	middle->connectInput(0, first->getOutput(0));
	last->connectInput(0, middle->getOutput(0));

	eval();
	setInput(in, 10);
	BOOST_TEST(value(last->getOutput(0)) == 13);

	const auto &order = dynamic_cast<sim::ReferenceSimulator&>(getSimulator()).getCombinatorialOrder();
	BOOST_REQUIRE(order.size() == 3);
	BOOST_TEST(order[0] == first);
	BOOST_TEST(order[1] == middle);
	BOOST_TEST(order[2] == last);
}

BOOST_FIXTURE_TEST_CASE(TruncatedInputIsReported, BoostUnitTestSimulationFixture)
{
	hlim::SignalRef in = pinIn("in", 2);
	auto *inc = DesignScope::createNode<test::Node_TestIncrement>(2);
	inc->connectInput(0, in);

	eval();
	setInput(in, 7);
	BOOST_TEST(value(in) == 3);
	BOOST_TEST(value(inc->getOutput(0)) == 0);
	BOOST_TEST(getWarnings().size() == 1);
	m_warnings.clear();
}

BOOST_FIXTURE_TEST_CASE(OnlyInputPinsCanBeSet, ClockedTest)
{
	hlim::SignalRef counter = test::buildCounter(clock().getClk(), 8, "counter");
	eval();
	BOOST_CHECK_THROW(setInput(counter, 1), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(AdvanceBySimulationTime, ClockedTest)
{
	hlim::SignalRef counter = test::buildCounter(clock().getClk(), 8, "counter");
	eval();

	// 100 MHz: rising edges at 5, 15, 25, ... ns
	getSimulator().advance(hlim::ClockRational(30, 1'000'000'000));
	BOOST_TEST(value(counter) == 3);
	BOOST_TEST(getSimulator().getCurrentSimulationTime() == hlim::ClockRational(30, 1'000'000'000));
}

BOOST_FIXTURE_TEST_CASE(AbortStopsTheSimulation, ClockedTest)
{
	struct AbortAfter : sim::SimulatorCallbacks {
		sim::Simulator &simulator;
		const hlim::Clock *clock;
		AbortAfter(sim::Simulator &simulator, const hlim::Clock *clock) : simulator(simulator), clock(clock) { }
		virtual void onClock(const hlim::Clock *clk, bool risingEdge) override {
			if (clk == clock && risingEdge && simulator.getClockCycles(clock) == 4)
				simulator.abort();
		}
	} aborter(getSimulator(), clock().getClk());
	getSimulator().addCallbacks(&aborter);

	hlim::SignalRef counter = test::buildCounter(clock().getClk(), 8, "counter");
	runTicks(clock().getClk(), 100);

	BOOST_TEST(getSimulator().abortCalled());
	BOOST_TEST(value(counter) == 4);
}

BOOST_AUTO_TEST_CASE(FormatTime)
{
	auto format = [](hlim::ClockRational time) {
		std::stringstream s;
		hlim::formatTime(s, time);
		return s.str();
	};

	BOOST_TEST(format(hlim::ClockRational(1, 1'000)) == "1 ms");
	BOOST_TEST(format(hlim::ClockRational(5, 1'000'000'000)) == "5 ns");
	BOOST_TEST(format(hlim::ClockRational(3, 2)) == "1.5 s");
	BOOST_TEST(format(hlim::ClockRational(0)) == "0 s");
}

BOOST_AUTO_TEST_SUITE_END()
