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
#pragma once
#include <lotctl/frontend.h>

#include "ParkingLotConfig.h"
#include "Debouncer.h"
#include "ClockDivider.h"
#include "OccupancyCounter.h"
#include "DisplayMultiplexer.h"
#include "SevenSegment.h"

#include <optional>

namespace lotctl::scl
{
	/**
	 * @brief Top level of the parking lot controller.
	 * @details Must be built inside a DesignScope. Creates the system clock with its reset pin and the pins
	 * entry_raw, exit_raw, start, stop, manual_set_value (5 bit), manual_set_enable as well as the output pins
	 * open_flag, full_flag, closed_flag, digit_select and segments. The count register is named "count".
	 *
	 * The debounced entry and exit pulses, the start/stop controls and the manual load feed the occupancy counter
	 * in the system clock domain. The display multiplexer and the digit encoder run in the divided clock domain,
	 * the encoder reads the count without synchronization.
	 */
	class ParkingLot
	{
	public:
		static constexpr size_t MANUAL_VALUE_WIDTH = 5;
		static constexpr std::uint64_t MAX_DISPLAYABLE_CAPACITY = 9'999;

		struct Pins {
			hlim::SignalRef reset;
			hlim::SignalRef entryRaw;
			hlim::SignalRef exitRaw;
			hlim::SignalRef start;
			hlim::SignalRef stop;
			hlim::SignalRef manualSetValue;
			hlim::SignalRef manualSetEnable;
		};

		ParkingLot(const ParkingLotConfig &config = {});

		inline const ParkingLotConfig &config() const { return m_config; }
		inline const Clock &systemClock() const { return *m_systemClock; }
		inline const Clock &displayClock() const { return m_divider->dividedClock(); }
		inline const Pins &pins() const { return m_pins; }

		inline const Debouncer &entryDebouncer() const { return *m_entryDebouncer; }
		inline const Debouncer &exitDebouncer() const { return *m_exitDebouncer; }
		inline const ClockDivider &divider() const { return *m_divider; }
		inline const OccupancyCounter &occupancy() const { return *m_occupancy; }
		inline const DisplayMultiplexer &multiplexer() const { return *m_multiplexer; }
		inline const DigitEncoder &encoder() const { return *m_encoder; }

		inline hlim::SignalRef count() const { return m_occupancy->count(); }
		inline hlim::SignalRef openFlag() const { return m_occupancy->open(); }
		inline hlim::SignalRef fullFlag() const { return m_occupancy->full(); }
		inline hlim::SignalRef closedFlag() const { return m_occupancy->closed(); }
		inline hlim::SignalRef digitSelect() const { return m_multiplexer->digitSelect(); }
		inline hlim::SignalRef segments() const { return m_encoder->segments(); }
	protected:
		ParkingLotConfig m_config;
		Pins m_pins;

		std::optional<Clock> m_systemClock;
		std::optional<Debouncer> m_entryDebouncer;
		std::optional<Debouncer> m_exitDebouncer;
		std::optional<ClockDivider> m_divider;
		std::optional<OccupancyCounter> m_occupancy;
		std::optional<DisplayMultiplexer> m_multiplexer;
		std::optional<DigitEncoder> m_encoder;
	};
}
