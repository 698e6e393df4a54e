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
#include "Clock.h"
#include "DesignScope.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <sstream>

namespace lotctl {

	hlim::ClockRational clockFromString(std::string text)
	{
		double number = 0;
		std::string unit;
		std::istringstream{ text } >> number >> unit;

		LOTCTL_DESIGNCHECK_HINT(number > 0, "Invalid frequency or period '" + text + "'.");

		ClockConfig::ClockRational roundedNumber{ uint64_t(number * 1000), 1000 };
		ClockConfig::ClockRational frequency;

		boost::algorithm::to_lower(unit);
		boost::algorithm::trim(unit);
		if (unit == "ps")
			frequency = ClockConfig::ClockRational{ 1'000'000'000'000, 1 } / roundedNumber;
		else if (unit == "ns")
			frequency = ClockConfig::ClockRational{ 1'000'000'000, 1 } / roundedNumber;
		else if (unit == "us")
			frequency = ClockConfig::ClockRational{ 1'000'000, 1 } / roundedNumber;
		else if (unit == "ms")
			frequency = ClockConfig::ClockRational{ 1'000, 1 } / roundedNumber;
		else if (unit == "s")
			frequency = ClockConfig::ClockRational{ 1, 1 } / roundedNumber;
		else if (unit == "hz" || unit.empty())
			frequency = ClockConfig::ClockRational{ 1, 1 } * roundedNumber;
		else if (unit == "khz")
			frequency = ClockConfig::ClockRational{ 1'000, 1 } * roundedNumber;
		else if (unit == "mhz")
			frequency = ClockConfig::ClockRational{ 1'000'000, 1 } * roundedNumber;
		else if (unit == "ghz")
			frequency = ClockConfig::ClockRational{ 1'000'000'000, 1 } * roundedNumber;
		else
			LOTCTL_DESIGNCHECK_HINT(false, "Unknown frequency or period unit '" + unit + "'.");

		return frequency;
	}

	void ClockConfig::loadConfig(const utils::ConfigTree& config)
	{
		if (config.isScalar())
			absoluteFrequency = clockFromString(config.as<std::string>());
		else
		{
			if(config["name"])
				name = config["name"].as<std::string>();

			if (config["frequency"])
				absoluteFrequency = clockFromString(config["frequency"].as<std::string>());

			if (config["period"])
				absoluteFrequency = clockFromString(config["period"].as<std::string>());

			if (config["clock_edge"])
				triggerEvent = config["clock_edge"].as<TriggerEvent>();

			if (config["reset_name"])
				resetName = config["reset_name"].as<std::string>();
		}
	}

	std::ostream& operator << (std::ostream& s, const ClockConfig& cfg)
	{
		if (cfg.name)
			s << "clock " << *cfg.name;
		else
			s << "unnamed clock";

		if (cfg.absoluteFrequency) {
			s << " with period ";
			hlim::formatTime(s, hlim::ClockRational(1) / *cfg.absoluteFrequency);
		}
		if (cfg.resetName)
			s << ", reset " << *cfg.resetName;
		if (cfg.triggerEvent)
			s << ", triggers on " << magic_enum::enum_name(*cfg.triggerEvent);
		return s;
	}

	Clock::Clock(const ClockConfig &config)
	{
		LOTCTL_DESIGNCHECK_HINT(config.absoluteFrequency, "The frequency of a root clock must be specified.");

		m_clock = DesignScope::createClock<hlim::RootClock>(config.name ? *config.name : std::string("clock"), *config.absoluteFrequency);
		if (config.resetName)
			m_clock->setResetName(*config.resetName);
		if (config.triggerEvent)
			m_clock->setTriggerEvent(*config.triggerEvent);

		auto *circuit = &DesignScope::get()->getCircuit();
		m_clock->setResetSignal(circuit->createPinIn(m_clock->getResetName(), 1, circuit->getRootNodeGroup()));
	}

}
