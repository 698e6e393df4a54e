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

#include <lotctl/scl/ParkingLotConfig.h>
#include <lotctl/scl/ClockDivider.h>

#include <boost/test/unit_test.hpp>

#include <utility>

using namespace lotctl;

namespace {

	class CollectingInterface : public dbg::DebugInterface
	{
		public:
			CollectingInterface(std::vector<std::string> &lines) : m_lines(lines) { }
			virtual void log(dbg::LogMessage msg) override { m_lines.push_back(dbg::ConsoleInterface::format(msg)); }
		protected:
			std::vector<std::string> &m_lines;
	};

	struct LogCapture
	{
		LogCapture() { m_previous = std::exchange(dbg::DebugInterface::instance, std::make_unique<CollectingInterface>(lines)); }
		~LogCapture() { dbg::DebugInterface::instance = std::move(m_previous); }

		bool contains(std::string_view text) const {
			for (const auto &l : lines)
				if (l.find(text) != std::string::npos)
					return true;
			return false;
		}

		std::vector<std::string> lines;
	private:
		std::unique_ptr<dbg::DebugInterface> m_previous;
	};

}

BOOST_AUTO_TEST_SUITE(Logging)

BOOST_AUTO_TEST_CASE(FormatNamesSeverityAndSource)
{
	std::string line = dbg::ConsoleInterface::format(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_CONFIG
				<< "capacity is " << size_t(20));
	BOOST_TEST(line == "[LOG_WARNING][LOG_CONFIG] capacity is 20");
}

BOOST_FIXTURE_TEST_CASE(AnchorIsPrintedAsInstancePath, LogCapture)
{
	DesignScope design;
	Area outer("ParkingLot");
	Area inner("ClockDivider");

	dbg::log(dbg::LogMessage(inner.getNodeGroup()) << dbg::LogMessage::LOG_DESIGN << "elaborated");

	BOOST_REQUIRE(lines.size() == 1);
	BOOST_TEST(lines.front() == "[LOG_INFO][LOG_DESIGN][ParkingLot/ClockDivider] elaborated");
}

BOOST_FIXTURE_TEST_CASE(MissingSectionIsReported, LogCapture)
{
	utils::ConfigTree config;
	config.loadFromString("unrelated: 1\n");

	scl::ParkingLotConfig lot;
	lot.load(config);

	BOOST_TEST(contains("[LOG_WARNING][LOG_CONFIG]"));
	BOOST_TEST(lot.capacity == 20);
}

BOOST_FIXTURE_TEST_CASE(DividerLogsItsThreshold, LogCapture)
{
	DesignScope design;
	ClockConfig config;
	config.absoluteFrequency = hlim::ClockRational(1'000'000);
	config.name = "clock";
	config.resetName = "reset";
	Clock clock(config);
	ClockScope clkScp(clock);

	scl::ClockDivider divider(hlim::ClockRational(100'000));

	BOOST_TEST(contains("[ClockDivider] Clock divider threshold is 5"));
}

BOOST_AUTO_TEST_SUITE_END()
