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

#include <lotctl/scl/ClockDivider.h>

#include <boost/test/unit_test.hpp>

using namespace lotctl;

BOOST_AUTO_TEST_SUITE(ClockDivider)

BOOST_AUTO_TEST_CASE(Threshold)
{
	BOOST_TEST(scl::ClockDivider::computeThreshold(hlim::ClockRational(100'000'000), hlim::ClockRational(1'000)) == 50'000);
	BOOST_TEST(scl::ClockDivider::computeThreshold(hlim::ClockRational(1'000), hlim::ClockRational(3)) == 166);
	BOOST_TEST(scl::ClockDivider::computeThreshold(hlim::ClockRational(4), hlim::ClockRational(1)) == 2);

	BOOST_CHECK_THROW(scl::ClockDivider::computeThreshold(hlim::ClockRational(1'000), hlim::ClockRational(0)), utils::DesignError);
	BOOST_CHECK_THROW(scl::ClockDivider::computeThreshold(hlim::ClockRational(1'000), hlim::ClockRational(600)), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(TooFastTargetIsRejected, ClockedTest)
{
	BOOST_CHECK_THROW(scl::ClockDivider(hlim::ClockRational(60'000'000)), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(TickPeriodAndDutyCycle, ClockedTest)
{
	// 100 MHz / 10 MHz / 2 = 5, the tick period is 2 * (5 + 1) = 12 cycles
	scl::ClockDivider divider(hlim::ClockRational(10'000'000));
	BOOST_TEST(divider.threshold() == 5);
	BOOST_TEST(divider.counter().width == 3);
	BOOST_TEST(divider.dividedClock().name() == "clock_divided");
	BOOST_TEST(divider.dividedClock().absoluteFrequency() == hlim::ClockRational(100'000'000, 12));

	eval();
	BOOST_TEST(value(divider.counter()) == 0);
	BOOST_TEST(value(divider.tick()) == 0);

	size_t highCycles = 0;
	size_t risingEdges = 0;
	bool lastTick = false;
	for ([[maybe_unused]] auto i : utils::Range(120)) {
		cycles(1);
		bool tick = value(divider.tick());
		if (tick) highCycles++;
		if (tick && !lastTick) risingEdges++;
		lastTick = tick;
		BOOST_TEST(value(divider.counter()) <= divider.threshold());
	}

	BOOST_TEST(highCycles == 60);
	BOOST_TEST(risingEdges == 10);
	BOOST_TEST(getSimulator().getClockCycles(divider.dividedClock().getClk()) == 10);
}

BOOST_FIXTURE_TEST_CASE(TickRisesAfterThresholdPlusOneCycles, ClockedTest)
{
	scl::ClockDivider divider(hlim::ClockRational(10'000'000));

	runTicks(clock().getClk(), 5);
	BOOST_TEST(value(divider.counter()) == 5);
	BOOST_TEST(value(divider.tick()) == 0);

	cycles(1);
	BOOST_TEST(value(divider.counter()) == 0);
	BOOST_TEST(value(divider.tick()) == 1);
	BOOST_TEST(getSimulator().getValueOfClock(divider.dividedClock().getClk()) == true);

	cycles(6);
	BOOST_TEST(value(divider.tick()) == 0);
}

BOOST_FIXTURE_TEST_CASE(ResetHoldsTheTickLow, ClockedTest)
{
	scl::ClockDivider divider(hlim::ClockRational(10'000'000));

	runTicks(clock().getClk(), 8);
	BOOST_TEST(value(divider.tick()) == 1);
	BOOST_TEST(value(divider.counter()) == 2);

	setInput(clock().resetSignal(), 1);
	cycles(1);
	BOOST_TEST(value(divider.tick()) == 0);
	BOOST_TEST(value(divider.counter()) == 0);

	size_t dividedCycles = getSimulator().getClockCycles(divider.dividedClock().getClk());
	cycles(30);
	BOOST_TEST(value(divider.tick()) == 0);
	BOOST_TEST(value(divider.counter()) == 0);
	BOOST_TEST(getSimulator().getClockCycles(divider.dividedClock().getClk()) == dividedCycles);

	setInput(clock().resetSignal(), 0);
	cycles(6);
	BOOST_TEST(value(divider.tick()) == 1);
}

BOOST_AUTO_TEST_SUITE_END()
