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

#include <lotctl/scl/ParkingLot.h>
#include <lotctl/scl/DisplayObserver.h>

#include <boost/test/unit_test.hpp>

using namespace lotctl;

namespace {

	scl::ParkingLotConfig smallConfig()
	{
		scl::ParkingLotConfig config;
		// 1 MHz / 100 kHz / 2 = 5, a display tick every 12 cycles
		config.systemClock.absoluteFrequency = hlim::ClockRational(1'000'000);
		config.refreshFrequency = hlim::ClockRational(100'000);
		config.debounceLength = 4;
		return config;
	}

	struct ParkingLotFixture : public BoostUnitTestSimulationFixture
	{
		scl::ParkingLot lot{ smallConfig() };
		scl::DisplayObserver display{ getSimulator(), lot.digitSelect(), lot.segments() };

		void cycles(size_t numCycles) { runCycles(lot.systemClock().getClk(), numCycles); }

		/// Holds a raw button for a while and releases it.
		void press(hlim::SignalRef button) {
			setInput(button, 1);
			cycles(10);
			setInput(button, 0);
			cycles(10);
		}

		/// Drives a raw button with a sequence of samples, one per cycle.
		void bounce(hlim::SignalRef button, const std::vector<int> &samples) {
			for (int s : samples) {
				setInput(button, s);
				cycles(1);
			}
		}

		/// Lets every digit of the display refresh.
		void refreshDisplay() { cycles(60); }

		/// Runs system cycles until the display tick moves the digit select to the given pattern.
		void waitForDigitSelect(std::uint64_t select) {
			for ([[maybe_unused]] auto i : utils::Range(60)) {
				std::uint64_t before = value(lot.digitSelect());
				cycles(1);
				if (before != select && value(lot.digitSelect()) == select)
					return;
			}
			BOOST_FAIL("digit select never reached the requested position");
		}

		std::uint64_t count() { return value(lot.count()); }
	};
}

BOOST_AUTO_TEST_SUITE(ParkingLot)

BOOST_FIXTURE_TEST_CASE(Interface, ParkingLotFixture)
{
	const auto &circuit = design.getCircuit();

	for (const char *name : { "reset", "entry_raw", "exit_raw", "start", "stop", "manual_set_enable" }) {
		auto pin = circuit.findSignal(name);
		BOOST_REQUIRE(pin);
		BOOST_TEST((circuit.getSignal(*pin).kind == hlim::SignalKind::PIN_IN));
		BOOST_TEST(pin->width == 1);
	}
	BOOST_TEST(circuit.findSignal("manual_set_value")->width == 5);

	BOOST_TEST(*circuit.findSignal("open_flag") == lot.openFlag());
	BOOST_TEST(*circuit.findSignal("full_flag") == lot.fullFlag());
	BOOST_TEST(*circuit.findSignal("closed_flag") == lot.closedFlag());
	BOOST_TEST(circuit.findSignal("digit_select")->width == 4);
	BOOST_TEST(circuit.findSignal("segments")->width == 7);
	BOOST_TEST(circuit.findSignal("count")->width == 5);

	BOOST_TEST(lot.divider().threshold() == 5);
	BOOST_TEST(circuit.getClocks().size() == 2);
	BOOST_TEST(lot.displayClock().absoluteFrequency() == hlim::ClockRational(1'000'000, 12));

	BOOST_TEST(lot.entryDebouncer().filter().name() == "Integrator");
	BOOST_TEST((lot.entryDebouncer().mode() == scl::Debouncer::OutputMode::PRESS_PULSE));
	BOOST_TEST(lot.exitDebouncer().filterState().width == 4);
}

BOOST_AUTO_TEST_CASE(CapacityMustFitTheDisplay)
{
	DesignScope design;
	scl::ParkingLotConfig config;
	config.capacity = 10'000;
	BOOST_CHECK_THROW(scl::ParkingLot{ config }, utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(PowerOn, ParkingLotFixture)
{
	eval();
	BOOST_TEST(count() == 0);
	BOOST_TEST(value(lot.openFlag()) == 1);
	BOOST_TEST(value(lot.fullFlag()) == 0);
	BOOST_TEST(value(lot.closedFlag()) == 0);
	BOOST_TEST(value(lot.segments()) == scl::SEGMENTS_BLANK);
}

BOOST_FIXTURE_TEST_CASE(BouncingPressCountsOnce, ParkingLotFixture)
{
	eval();

	bounce(lot.pins().entryRaw, { 1, 0, 1, 1, 0, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 1, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0 });
	BOOST_TEST(count() == 1);

	press(lot.pins().entryRaw);
	BOOST_TEST(count() == 2);

	bounce(lot.pins().exitRaw, { 1, 0, 1, 0, 1, 1, 1, 1, 1, 1, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0 });
	BOOST_TEST(count() == 1);
}

BOOST_FIXTURE_TEST_CASE(DisplayShowsTheCount, ParkingLotFixture)
{
	eval();

	for ([[maybe_unused]] auto i : utils::Range(7))
		press(lot.pins().entryRaw);
	BOOST_TEST(count() == 7);

	refreshDisplay();
	BOOST_TEST(display.text() == "0007");

	for ([[maybe_unused]] auto i : utils::Range(5))
		press(lot.pins().entryRaw);
	refreshDisplay();
	BOOST_TEST(display.text() == "0012");
}

BOOST_FIXTURE_TEST_CASE(SegmentsOnlyChangeOnADisplayTick, ParkingLotFixture)
{
	eval();
	waitForDigitSelect(scl::digitSelectFor(0));
	std::uint64_t segments = value(lot.segments());

	setInput(lot.pins().manualSetValue, 7);
	setInput(lot.pins().manualSetEnable, 1);
	cycles(1);
	setInput(lot.pins().manualSetEnable, 0);
	BOOST_TEST(count() == 7);

	// A display tick every 12 system cycles
	for ([[maybe_unused]] auto i : utils::Range(9)) {
		cycles(1);
		BOOST_TEST(value(lot.digitSelect()) == scl::digitSelectFor(0));
		BOOST_TEST(value(lot.segments()) == segments);
	}

	waitForDigitSelect(scl::digitSelectFor(1));
	BOOST_TEST(value(lot.segments()) == scl::encodeDigit(7));
}

BOOST_FIXTURE_TEST_CASE(FullLotRejectsEntries, ParkingLotFixture)
{
	eval();

	setInput(lot.pins().manualSetValue, 31);
	setInput(lot.pins().manualSetEnable, 1);
	cycles(1);
	setInput(lot.pins().manualSetEnable, 0);
	BOOST_TEST(count() == 20);
	BOOST_TEST(value(lot.fullFlag()) == 1);

	press(lot.pins().entryRaw);
	BOOST_TEST(count() == 20);

	refreshDisplay();
	BOOST_TEST(display.text() == "0020");

	press(lot.pins().exitRaw);
	BOOST_TEST(count() == 19);
	BOOST_TEST(value(lot.fullFlag()) == 0);
}

BOOST_FIXTURE_TEST_CASE(StopClosesUntilReset, ParkingLotFixture)
{
	eval();
	press(lot.pins().entryRaw);
	press(lot.pins().entryRaw);

	setInput(lot.pins().stop, 1);
	cycles(1);
	setInput(lot.pins().stop, 0);
	cycles(100);
	BOOST_TEST(value(lot.closedFlag()) == 1);
	BOOST_TEST(value(lot.openFlag()) == 1);
	BOOST_TEST(count() == 2);

	setInput(lot.pins().reset, 1);
	cycles(2);
	setInput(lot.pins().reset, 0);
	BOOST_TEST(value(lot.closedFlag()) == 0);
	BOOST_TEST(value(lot.openFlag()) == 1);
	BOOST_TEST(value(lot.fullFlag()) == 0);
	BOOST_TEST(count() == 0);

	refreshDisplay();
	BOOST_TEST(display.text() == "0000");
}

BOOST_FIXTURE_TEST_CASE(EntriesThenExitsReturnToStart, ParkingLotFixture)
{
	eval();
	press(lot.pins().entryRaw);

	for ([[maybe_unused]] auto i : utils::Range(5))
		press(lot.pins().entryRaw);
	BOOST_TEST(count() == 6);
	for ([[maybe_unused]] auto i : utils::Range(5))
		press(lot.pins().exitRaw);
	BOOST_TEST(count() == 1);
}

BOOST_FIXTURE_TEST_CASE(RecordsAWaveform, ParkingLotFixture)
{
	std::filesystem::path dir = std::filesystem::path{ "tmp" } / "parkingLot";
	std::filesystem::create_directories(dir);
	recordVCD((dir / "RecordsAWaveform.vcd").string());

	eval();
	press(lot.pins().entryRaw);
	refreshDisplay();
	m_vcdSink.reset();

	std::fstream file((dir / "RecordsAWaveform.vcd").string(), std::fstream::in);
	BOOST_REQUIRE((bool) file);
	std::stringstream buffer;
	buffer << file.rdbuf();

	BOOST_TEST(std::regex_search(buffer.str(), std::regex{"\\$var wire 5 \\S+ count \\$end"}));
	BOOST_TEST(std::regex_search(buffer.str(), std::regex{"\\$var wire 7 \\S+ segments \\$end"}));
	BOOST_TEST(std::regex_search(buffer.str(), std::regex{"\\$var wire 1 \\S+ clock_divided \\$end"}));
	BOOST_TEST(std::regex_search(buffer.str(), std::regex{"\\$scope module EntryDebouncer \\$end"}));
}

BOOST_AUTO_TEST_SUITE_END()
