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
#include <lotctl/utils/ConfigTree.h>

#include "Debouncer.h"

#include <cstdint>
#include <memory>
#include <ostream>

namespace lotctl::scl
{
	enum class DebounceAlgorithm {
		PASS_THROUGH,
		SHIFT_REGISTER,
		INTEGRATOR
	};

	/**
	 * @brief Elaboration time constants of the parking lot controller.
	 * @details Defaults: capacity 20, 100 MHz system clock named "clock" with reset "reset", 1 kHz display refresh,
	 * integrator debouncing with threshold 16 and press pulse output.
	 */
	struct ParkingLotConfig
	{
		ParkingLotConfig();

		std::uint64_t capacity = 20;
		ClockConfig systemClock;
		hlim::ClockRational refreshFrequency = 1'000;

		DebounceAlgorithm debounceAlgorithm = DebounceAlgorithm::INTEGRATOR;
		/// Threshold of the integrator or number of samples of the shift register
		std::uint64_t debounceLength = 16;
		Debouncer::OutputMode debounceOutput = Debouncer::OutputMode::PRESS_PULSE;

		/// Overrides the defaults with the values found in the parking_lot section of the configuration.
		void load(const utils::ConfigTree &config);

		std::unique_ptr<DebounceFilter> makeDebounceFilter() const;
	};

	std::ostream &operator<<(std::ostream &stream, const ParkingLotConfig &config);
}
