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

#include <boost/test/unit_test.hpp>

using namespace lotctl;

namespace {

	template<class BaseFixture>
	class VCDTestFixture : public BaseFixture
	{
		public:
			VCDTestFixture();

			std::string VCDContent();
			bool VCDContains(const std::regex &regex) { return std::regex_search(VCDContent(), regex); }
			/// Identifier code of a declared variable.
			std::string VCDIdentifier(const std::string &name, size_t width);
		protected:
			std::filesystem::path m_testDir;

			void prepRun() override;
	};

	template<class BaseFixture>
	VCDTestFixture<BaseFixture>::VCDTestFixture()
	{
		const auto &testCase = boost::unit_test::framework::current_test_case();
		std::filesystem::path testCaseFile{ std::string{ testCase.p_file_name.begin(), testCase.p_file_name.end() } };
		m_testDir = std::filesystem::path{ "tmp" } / testCaseFile.stem() / testCase.p_name.get();

		std::error_code ignored;
		std::filesystem::remove_all(m_testDir, ignored);
		std::filesystem::create_directories(m_testDir);
	}

	template<class BaseFixture>
	void VCDTestFixture<BaseFixture>::prepRun()
	{
		BaseFixture::recordVCD((m_testDir / "test.vcd").string());
	}

	template<class BaseFixture>
	std::string VCDTestFixture<BaseFixture>::VCDContent()
	{
		BaseFixture::m_vcdSink.reset();
		std::fstream file((m_testDir / "test.vcd").string(), std::fstream::in);
		BOOST_TEST((bool) file);
		std::stringstream buffer;
		buffer << file.rdbuf();
		return buffer.str();
	}

	template<class BaseFixture>
	std::string VCDTestFixture<BaseFixture>::VCDIdentifier(const std::string &name, size_t width)
	{
		std::smatch match;
		std::string content = VCDContent();
		BOOST_REQUIRE(std::regex_search(content, match, std::regex{ "\\$var wire " + std::to_string(width) + " (\\S+) " + name + " \\$end" }));
		return match[1].str();
	}
}

BOOST_AUTO_TEST_SUITE(VCD)

BOOST_FIXTURE_TEST_CASE(NamedSignalsAndClocksAreRecorded, VCDTestFixture<ClockedTest>)
{
	hlim::SignalRef counter = test::buildCounter(clock().getClk(), 8, "counter");
	pinOut(counter, "counter_out");

	runTicks(clock().getClk(), 10);

	BOOST_TEST(VCDContains(std::regex{"\\$timescale\\s+1ps"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 8 \\S+ counter \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 8 \\S+ counter_out \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$scope module clocks \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ clock \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ reset \\$end"}));
	// The counter reaches 10 on the 10th rising edge at 95 ns
	BOOST_TEST(VCDContains(std::regex{"#95000\\n"}));
	std::string id = VCDIdentifier("counter", 8);
	std::string content = VCDContent();
	BOOST_TEST(content.find("b00001010 " + id + "\n") != std::string::npos);
	BOOST_TEST(content.find("b00001011 " + id + "\n") == std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(DerivedClocksAreRecorded, VCDTestFixture<ClockedTest>)
{
	hlim::SignalRef toggle = test::buildToggle(clock().getClk(), "toggle");

	auto *derived = DesignScope::createClock<hlim::DerivedClock>(clock().getClk());
	derived->setName("half_clock");
	derived->setFrequencyMultiplier(hlim::ClockRational(1, 2));
	derived->setLogicClockDriver(toggle);
	test::buildCounter(derived, 4, "slow_counter");

	runTicks(clock().getClk(), 4);

	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ half_clock \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 4 \\S+ slow_counter \\$end"}));
}

BOOST_AUTO_TEST_SUITE_END()
