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
#include "ParkingLot.h"

#include <sstream>

namespace lotctl::scl
{
	ParkingLot::ParkingLot(const ParkingLotConfig &config) :
		m_config(config)
	{
		LOTCTL_DESIGNCHECK_HINT(m_config.capacity >= 1, "The parking lot capacity must be at least one.");
		LOTCTL_DESIGNCHECK_HINT(m_config.capacity <= MAX_DISPLAYABLE_CAPACITY, "The parking lot capacity must fit into the 4 digit display.");

		m_systemClock.emplace(m_config.systemClock);
		ClockScope systemScope(*m_systemClock);

		m_pins.reset = m_systemClock->resetSignal();
		m_pins.entryRaw = pinIn("entry_raw");
		m_pins.exitRaw = pinIn("exit_raw");
		m_pins.start = pinIn("start");
		m_pins.stop = pinIn("stop");
		m_pins.manualSetValue = pinIn("manual_set_value", MANUAL_VALUE_WIDTH);
		m_pins.manualSetEnable = pinIn("manual_set_enable");

		m_entryDebouncer.emplace("EntryDebouncer", m_pins.entryRaw, m_config.makeDebounceFilter(), m_config.debounceOutput);
		m_exitDebouncer.emplace("ExitDebouncer", m_pins.exitRaw, m_config.makeDebounceFilter(), m_config.debounceOutput);

		m_occupancy.emplace(m_config.capacity, OccupancyCounter::Inputs{
			.entry = m_entryDebouncer->output(),
			.exit = m_exitDebouncer->output(),
			.start = m_pins.start,
			.stop = m_pins.stop,
			.manualValue = m_pins.manualSetValue,
			.manualEnable = m_pins.manualSetEnable,
		});
		setName(m_occupancy->count(), "count");

		m_divider.emplace(m_config.refreshFrequency);
		{
			ClockScope displayScope(m_divider->dividedClock());
			m_multiplexer.emplace();
			m_encoder.emplace(m_multiplexer->digitSelect(), m_occupancy->count());
		}

		pinOut(m_occupancy->open(), "open_flag");
		pinOut(m_occupancy->full(), "full_flag");
		pinOut(m_occupancy->closed(), "closed_flag");
		pinOut(m_multiplexer->digitSelect(), "digit_select");
		pinOut(m_encoder->segments(), "segments");

		std::stringstream summary;
		summary << m_config;
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN << "Elaborated parking lot: " << summary.str());
	}
}
