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

#include "SimulatorCallbacks.h"
#include "../hlim/SignalRef.h"

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lotctl::hlim {
	class Circuit;
	class NodeGroup;
}

namespace lotctl::sim {

class Simulator;

/**
 * @brief Base class for waveform recorders (e.g. to write VCD files of a simulation run).
 */
class WaveformRecorder : public SimulatorCallbacks
{
	public:
		WaveformRecorder(const hlim::Circuit &circuit, Simulator &simulator);
		virtual ~WaveformRecorder() = default;

		/// Adds a signal under the given name. The same signal can be added multiple times under different names.
		void addSignal(hlim::SignalRef signal, std::string name, const hlim::NodeGroup *group, bool hidden);
		/// Adds all input and output pins to the top level of the waveform.
		void addAllPins();
		void addAllNamedSignals();
		/// Adds every register and combinatorial signal, internal node state is added as hidden signals.
		void addAllSignals();

		virtual void onAfterPowerOn() override;
		virtual void onCommitState() override;
		virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
	protected:
		const hlim::Circuit &m_circuit;
		Simulator &m_simulator;
		bool m_initialized = false;

		struct Signal {
			std::string name;
			hlim::SignalRef signal;
			const hlim::NodeGroup *nodeGroup = nullptr;
			bool isHidden = false;
		};
		std::vector<Signal> m_id2Signal;
		std::vector<std::uint64_t> m_trackedState;
		std::set<std::pair<size_t, std::string>> m_alreadyAddedSignals;

		void initializeStates();
		virtual void initialize() = 0;
		virtual void signalChanged(size_t id) = 0;
		virtual void advanceTick(const hlim::ClockRational &simulationTime) = 0;
};

}
