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

#include <lotctl/scl/OccupancyCounter.h>

#include <boost/test/unit_test.hpp>

#include <random>

using namespace lotctl;

namespace {

	struct OccupancyFixture : public ClockedTest
	{
		static constexpr std::uint64_t capacity = 5;

		scl::OccupancyCounter::Inputs inputs{
			.entry = pinIn("entry"),
			.exit = pinIn("exit"),
			.start = pinIn("start"),
			.stop = pinIn("stop"),
			.manualValue = pinIn("manual_value", 5),
			.manualEnable = pinIn("manual_enable"),
		};
		scl::OccupancyCounter occupancy{ capacity, inputs };

		void pulse(hlim::SignalRef pin, std::uint64_t v = 1) {
			setInput(pin, v);
			cycles(1);
			setInput(pin, 0);
		}

		void manualSet(std::uint64_t v) {
			setInput(inputs.manualValue, v);
			pulse(inputs.manualEnable);
		}

		std::uint64_t count() { return value(occupancy.count()); }
	};
}

BOOST_AUTO_TEST_SUITE(OccupancyCounter)

BOOST_FIXTURE_TEST_CASE(PowerOnState, OccupancyFixture)
{
	BOOST_TEST(occupancy.count().width == 3);
	eval();

	BOOST_TEST(count() == 0);
	BOOST_TEST(value(occupancy.open()) == 1);
	BOOST_TEST(value(occupancy.full()) == 0);
	BOOST_TEST(value(occupancy.closed()) == 0);
}

BOOST_FIXTURE_TEST_CASE(EntryIncrementsUpToCapacity, OccupancyFixture)
{
	eval();
	setInput(inputs.entry, 1);
	for (auto i : utils::Range<std::uint64_t>(1, 9)) {
		cycles(1);
		BOOST_TEST(count() == std::min(i, capacity));
		BOOST_TEST(value(occupancy.full()) == (count() == capacity));
	}
}

BOOST_FIXTURE_TEST_CASE(ExitDecrementsDownToZero, OccupancyFixture)
{
	eval();
	manualSet(3);
	BOOST_TEST(count() == 3);

	setInput(inputs.exit, 1);
	cycles(1);
	BOOST_TEST(count() == 2);
	cycles(5);
	BOOST_TEST(count() == 0);
	BOOST_TEST(value(occupancy.full()) == 0);
}

BOOST_FIXTURE_TEST_CASE(SimultaneousEntryAndExitKeepTheCount, OccupancyFixture)
{
	eval();
	manualSet(2);

	setInput(inputs.entry, 1);
	setInput(inputs.exit, 1);
	cycles(4);
	BOOST_TEST(count() == 2);

	setInput(inputs.manualValue, 4);
	setInput(inputs.manualEnable, 1);
	cycles(1);
	BOOST_TEST(count() == 2);
}

BOOST_FIXTURE_TEST_CASE(ManualSetIsClamped, OccupancyFixture)
{
	eval();
	manualSet(4);
	BOOST_TEST(count() == 4);
	BOOST_TEST(value(occupancy.full()) == 0);

	manualSet(31);
	BOOST_TEST(count() == capacity);
	BOOST_TEST(value(occupancy.full()) == 1);

	manualSet(0);
	BOOST_TEST(count() == 0);
}

BOOST_FIXTURE_TEST_CASE(EntryOrExitShadowsManualSet, OccupancyFixture)
{
	eval();
	manualSet(capacity);
	BOOST_TEST(value(occupancy.full()) == 1);

	// Entry is blocked by full, the manual value is still ignored
	setInput(inputs.manualValue, 2);
	setInput(inputs.manualEnable, 1);
	pulse(inputs.entry);
	BOOST_TEST(count() == capacity);

	// Exit wins over manual set
	pulse(inputs.exit);
	BOOST_TEST(count() == capacity - 1);

	// Entry and exit together neither count nor load the manual value
	setInput(inputs.entry, 1);
	pulse(inputs.exit);
	setInput(inputs.entry, 0);
	BOOST_TEST(count() == capacity - 1);

	// Alone, the manual value gets through
	cycles(1);
	BOOST_TEST(count() == 2);

	setInput(inputs.manualEnable, 0);
	manualSet(0);
	setInput(inputs.manualValue, 4);
	setInput(inputs.manualEnable, 1);
	pulse(inputs.exit);
	BOOST_TEST(count() == 0);
}

BOOST_FIXTURE_TEST_CASE(StartAndStop, OccupancyFixture)
{
	eval();

	pulse(inputs.stop);
	BOOST_TEST(value(occupancy.closed()) == 1);
	BOOST_TEST(value(occupancy.open()) == 1);

	cycles(10);
	BOOST_TEST(value(occupancy.closed()) == 1);

	// Start does not clear the latch and has priority over stop
	setInput(inputs.stop, 1);
	pulse(inputs.start);
	setInput(inputs.stop, 0);
	BOOST_TEST(value(occupancy.closed()) == 1);
	BOOST_TEST(value(occupancy.open()) == 1);

	pulse(clock().resetSignal());
	BOOST_TEST(value(occupancy.closed()) == 0);
	BOOST_TEST(value(occupancy.open()) == 1);
}

BOOST_FIXTURE_TEST_CASE(ResetOverridesAllInputs, OccupancyFixture)
{
	eval();
	manualSet(4);
	pulse(inputs.stop);

	setInput(clock().resetSignal(), 1);
	setInput(inputs.entry, 1);
	setInput(inputs.stop, 1);
	setInput(inputs.manualValue, 3);
	setInput(inputs.manualEnable, 1);
	cycles(3);

	BOOST_TEST(count() == 0);
	BOOST_TEST(value(occupancy.open()) == 1);
	BOOST_TEST(value(occupancy.full()) == 0);
	BOOST_TEST(value(occupancy.closed()) == 0);
}

BOOST_FIXTURE_TEST_CASE(EntriesThenExitsReturnToStart, OccupancyFixture)
{
	eval();
	manualSet(1);

	for ([[maybe_unused]] auto i : utils::Range(4))
		pulse(inputs.entry);
	BOOST_TEST(count() == 5);

	for ([[maybe_unused]] auto i : utils::Range(4))
		pulse(inputs.exit);
	BOOST_TEST(count() == 1);
}

BOOST_FIXTURE_TEST_CASE(RandomInputsKeepTheInvariants, OccupancyFixture)
{
	eval();

	std::mt19937 rng{ 1234 };
	std::bernoulli_distribution rare(0.05);
	std::bernoulli_distribution often(0.4);
	std::uniform_int_distribution<std::uint64_t> manual(0, 31);

	bool closed = false;
	for ([[maybe_unused]] auto i : utils::Range(2000)) {
		const bool entry = often(rng);
		const bool exit = often(rng);
		const bool start = rare(rng);
		const bool stop = rare(rng);
		const bool reset = rare(rng) && rare(rng);
		std::uint64_t before = count();

		setInput(inputs.entry, entry);
		setInput(inputs.exit, exit);
		setInput(inputs.start, start);
		setInput(inputs.stop, stop);
		setInput(inputs.manualValue, manual(rng));
		setInput(inputs.manualEnable, rare(rng));
		setInput(clock().resetSignal(), reset);
		cycles(1);

		std::uint64_t after = count();
		BOOST_TEST(after <= capacity);
		BOOST_TEST(value(occupancy.full()) == (after == capacity));
		BOOST_TEST(value(occupancy.open()) == 1);

		if (reset)
			closed = false;
		else if (stop && !start)
			closed = true;
		BOOST_TEST(value(occupancy.closed()) == closed);

		if (!reset && entry && !exit && before < capacity)
			BOOST_TEST(after == before + 1);
		if (!reset && exit && !entry && before > 0)
			BOOST_TEST(after == before - 1);
		if (!reset && entry && exit)
			BOOST_TEST(after == before);
	}
}

BOOST_AUTO_TEST_SUITE_END()
