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
#include "ParkingLotConfig.h"

#include <sstream>

namespace lotctl::scl
{
	ParkingLotConfig::ParkingLotConfig()
	{
		systemClock.absoluteFrequency = hlim::ClockRational(100'000'000);
		systemClock.name = "clock";
		systemClock.resetName = "reset";
	}

	namespace {
		template<typename Func>
		void loadEntry(const utils::ConfigTree &section, const char *key, Func &&apply)
		{
			auto entry = section[key];
			if (!entry)
				return;

			try {
				apply(entry);
			} catch (const std::exception &e) {
				throw utils::DesignError(__FILE__, __LINE__, std::string("Invalid configuration value for parking_lot/") + key + ": " + e.what());
			}
		}
	}

	void ParkingLotConfig::load(const utils::ConfigTree &config)
	{
		auto section = config["parking_lot"];
		if (!section) {
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_CONFIG
				<< "No parking_lot section in configuration, using defaults");
			return;
		}

		loadEntry(section, "capacity", [&](const utils::ConfigTree &e) { capacity = e.as<std::uint64_t>(); });
		loadEntry(section, "system_clock", [&](const utils::ConfigTree &e) { systemClock.loadConfig(e); });
		loadEntry(section, "refresh_frequency", [&](const utils::ConfigTree &e) { refreshFrequency = clockFromString(e.as<std::string>()); });
		loadEntry(section, "debounce/algorithm", [&](const utils::ConfigTree &e) { debounceAlgorithm = e.as<DebounceAlgorithm>(); });
		loadEntry(section, "debounce/length", [&](const utils::ConfigTree &e) { debounceLength = e.as<std::uint64_t>(); });
		loadEntry(section, "debounce/output", [&](const utils::ConfigTree &e) { debounceOutput = e.as<Debouncer::OutputMode>(); });

		std::stringstream summary;
		summary << *this;
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_CONFIG << "Loaded configuration: " << summary.str());
	}

	std::unique_ptr<DebounceFilter> ParkingLotConfig::makeDebounceFilter() const
	{
		switch (debounceAlgorithm) {
			case DebounceAlgorithm::PASS_THROUGH:
				return std::make_unique<PassThroughFilter>();
			case DebounceAlgorithm::SHIFT_REGISTER:
				return std::make_unique<ShiftRegisterFilter>(debounceLength);
			case DebounceAlgorithm::INTEGRATOR:
				return std::make_unique<IntegratorFilter>(debounceLength);
		}
		LOTCTL_ASSERT_HINT(false, "Unhandled debounce algorithm");
		return {};
	}

	std::ostream &operator<<(std::ostream &stream, const ParkingLotConfig &config)
	{
		stream << "capacity " << config.capacity << ", system " << config.systemClock << ", refresh period ";
		hlim::formatTime(stream, hlim::ClockRational(1) / config.refreshFrequency);
		stream << ", debounce " << magic_enum::enum_name(config.debounceAlgorithm);
		if (config.debounceAlgorithm != DebounceAlgorithm::PASS_THROUGH)
			stream << '(' << config.debounceLength << ')';
		stream << " with " << magic_enum::enum_name(config.debounceOutput) << " output";
		return stream;
	}
}
