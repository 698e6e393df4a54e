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

#include <lotctl/scl/DisplayMultiplexer.h>
#include <lotctl/scl/SevenSegment.h>
#include <lotctl/scl/DisplayObserver.h>

#include <boost/test/unit_test.hpp>

#include <set>
#include <vector>

using namespace lotctl;

BOOST_AUTO_TEST_SUITE(Display)

BOOST_AUTO_TEST_CASE(DigitSelectIsActiveLowOneHot)
{
	BOOST_TEST(scl::digitSelectFor(0) == 0b1110);
	BOOST_TEST(scl::digitSelectFor(1) == 0b1101);
	BOOST_TEST(scl::digitSelectFor(2) == 0b1011);
	BOOST_TEST(scl::digitSelectFor(3) == 0b0111);

	for (auto position : utils::Range<size_t>(4))
		BOOST_TEST(*scl::selectedPosition(scl::digitSelectFor(position)) == position);
	BOOST_TEST(!scl::selectedPosition(0b1111));
	BOOST_TEST(!scl::selectedPosition(0b1100));
}

BOOST_AUTO_TEST_CASE(SegmentTable)
{
	BOOST_TEST(scl::encodeDigit(0) == 0x01);
	BOOST_TEST(scl::encodeDigit(1) == 0x4F);
	BOOST_TEST(scl::encodeDigit(7) == 0x0F);
	BOOST_TEST(scl::encodeDigit(8) == 0x00);
	BOOST_TEST(scl::encodeDigit(10) == scl::SEGMENTS_BLANK);
	BOOST_TEST(scl::encodeDigit(~0ull) == scl::SEGMENTS_BLANK);

	for (auto digit : utils::Range<size_t>(10))
		BOOST_TEST(size_t(*scl::decodeSegments(scl::encodeDigit(digit))) == digit);
	BOOST_TEST(!scl::decodeSegments(scl::SEGMENTS_BLANK));
}

BOOST_AUTO_TEST_CASE(DigitExtraction)
{
	BOOST_TEST(scl::selectDigit(0b1110, 1234) == 4);
	BOOST_TEST(scl::selectDigit(0b1101, 1234) == 3);
	BOOST_TEST(scl::selectDigit(0b1011, 1234) == 2);
	BOOST_TEST(scl::selectDigit(0b0111, 1234) == 1);
	BOOST_TEST(scl::selectDigit(0b0111, 7) == 0);
	BOOST_TEST(scl::selectDigit(0b1111, 1234) == 0);
	BOOST_TEST(scl::selectDigit(0b0000, 1234) == 0);
}

BOOST_FIXTURE_TEST_CASE(MultiplexerCyclesThroughFourDigits, ClockedTest)
{
	scl::DisplayMultiplexer mux;
	eval();

	BOOST_TEST(value(mux.digitIndex()) == 0);
	BOOST_TEST(value(mux.digitSelect()) == 0b1110);

	std::vector<std::uint64_t> selects;
	for ([[maybe_unused]] auto i : utils::Range(8)) {
		cycles(1);
		selects.push_back(value(mux.digitSelect()));
		BOOST_TEST(value(mux.digitSelect()) == scl::digitSelectFor(value(mux.digitIndex())));
	}

	std::vector<std::uint64_t> expected = { 0b1101, 0b1011, 0b0111, 0b1110, 0b1101, 0b1011, 0b0111, 0b1110 };
	BOOST_TEST(selects == expected, boost::test_tools::per_element());
	BOOST_TEST(std::set<std::uint64_t>(selects.begin(), selects.end()).size() == 4);
}

BOOST_FIXTURE_TEST_CASE(MultiplexerResetReturnsToFirstDigit, ClockedTest)
{
	scl::DisplayMultiplexer mux;
	runTicks(clock().getClk(), 2);
	BOOST_TEST(value(mux.digitIndex()) == 2);

	setInput(clock().resetSignal(), 1);
	cycles(2);
	BOOST_TEST(value(mux.digitIndex()) == 0);
	BOOST_TEST(value(mux.digitSelect()) == 0b1110);

	setInput(clock().resetSignal(), 0);
	cycles(1);
	BOOST_TEST(value(mux.digitIndex()) == 1);
}

BOOST_FIXTURE_TEST_CASE(EncoderShowsTheSelectedDigit, ClockedTest)
{
	hlim::SignalRef select = pinIn("digit_select", 4);
	hlim::SignalRef number = pinIn("value", 14);
	scl::DigitEncoder encoder(select, number);
	BOOST_TEST(encoder.segments().width == 7);

	eval();
	BOOST_TEST(value(encoder.segments()) == scl::SEGMENTS_BLANK);

	setInput(number, 7);
	setInput(select, scl::digitSelectFor(0));
	BOOST_TEST(value(encoder.segments()) == scl::SEGMENTS_BLANK);
	cycles(1);
	BOOST_TEST(value(encoder.segments()) == 0x0F);

	for (auto position : utils::Range<size_t>(1, 4)) {
		setInput(select, scl::digitSelectFor(position));
		cycles(1);
		BOOST_TEST(value(encoder.segments()) == 0x01);
	}

	setInput(select, 0b1100);
	cycles(1);
	BOOST_TEST(value(encoder.segments()) == 0x01);

	setInput(select, scl::digitSelectFor(0));
	setInput(clock().resetSignal(), 1);
	cycles(1);
	BOOST_TEST(value(encoder.segments()) == scl::SEGMENTS_BLANK);

	setInput(clock().resetSignal(), 0);
	cycles(1);
	BOOST_TEST(value(encoder.segments()) == 0x0F);
}

BOOST_FIXTURE_TEST_CASE(EncoderRejectsWrongWidths, ClockedTest)
{
	hlim::SignalRef select = pinIn("digit_select", 3);
	hlim::SignalRef number = pinIn("value", 14);
	BOOST_CHECK_THROW(scl::DigitEncoder(select, number), utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(EncoderLagsTheMultiplexerByOneTick, ClockedTest)
{
	hlim::SignalRef number = pinIn("value", 14);
	scl::DisplayMultiplexer mux;
	scl::DigitEncoder encoder(mux.digitSelect(), number);

	eval();
	setInput(number, 1234);

	std::uint64_t selected = value(mux.digitSelect());
	for ([[maybe_unused]] auto i : utils::Range(8)) {
		cycles(1);
		BOOST_TEST(value(encoder.segments()) == scl::encodeDigit(scl::selectDigit(selected, 1234)));
		selected = value(mux.digitSelect());
	}
}

BOOST_FIXTURE_TEST_CASE(ObserverReconstructsTheNumber, ClockedTest)
{
	hlim::SignalRef number = pinIn("value", 14);
	scl::DisplayMultiplexer mux;
	scl::DigitEncoder encoder(mux.digitSelect(), number);

	scl::DisplayObserver display(getSimulator(), mux.digitSelect(), encoder.segments());

	eval();
	BOOST_TEST(display.text() == "    ");
	BOOST_TEST(display.updates() == 0);

	setInput(number, 7);
	cycles(3);
	BOOST_TEST(display.text() == " 007");
	cycles(1);
	BOOST_TEST(display.text() == "0007");
	BOOST_TEST(display.updates() == 4);

	setInput(number, 1234);
	cycles(4);
	BOOST_TEST(display.text() == "1234");
	BOOST_TEST(display.glyph(0) == '4');
}

BOOST_AUTO_TEST_SUITE_END()
