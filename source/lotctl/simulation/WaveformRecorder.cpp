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
#include "WaveformRecorder.h"

#include "Simulator.h"

#include "../hlim/Circuit.h"
#include "../utils/Range.h"

namespace lotctl::sim {

WaveformRecorder::WaveformRecorder(const hlim::Circuit &circuit, Simulator &simulator) : m_circuit(circuit), m_simulator(simulator)
{
	m_simulator.addCallbacks(this);
}

void WaveformRecorder::addSignal(hlim::SignalRef signal, std::string name, const hlim::NodeGroup *group, bool hidden)
{
	LOTCTL_ASSERT_HINT(!m_initialized, "Signals must be added to waveforms before power on.");

	if (!m_alreadyAddedSignals.insert({ signal.index, name }).second)
		return;

	m_id2Signal.push_back({
		.name = std::move(name),
		.signal = signal,
		.nodeGroup = group,
		.isHidden = hidden,
	});
}

void WaveformRecorder::addAllPins()
{
	const auto &signals = m_circuit.getSignals();
	for (auto i : utils::Range(signals.size()))
		if (signals[i].kind == hlim::SignalKind::PIN_IN)
			addSignal({ .index = i, .width = signals[i].width }, signals[i].name, m_circuit.getRootNodeGroup(), false);

	for (const auto &pin : m_circuit.getOutputPins())
		addSignal(pin.signal, pin.name, m_circuit.getRootNodeGroup(), false);
}

void WaveformRecorder::addAllNamedSignals()
{
	const auto &signals = m_circuit.getSignals();
	for (auto i : utils::Range(signals.size()))
		if (signals[i].named && signals[i].kind != hlim::SignalKind::PIN_IN) {
			hlim::SignalRef ref{ .index = i, .width = signals[i].width };
			addSignal(ref, signals[i].name, m_circuit.getSignalGroup(ref), false);
		}
}

void WaveformRecorder::addAllSignals()
{
	const auto &signals = m_circuit.getSignals();
	for (auto i : utils::Range(signals.size())) {
		if (signals[i].kind == hlim::SignalKind::PIN_IN) continue;
		hlim::SignalRef ref{ .index = i, .width = signals[i].width };
		addSignal(ref, signals[i].name, m_circuit.getSignalGroup(ref), signals[i].kind == hlim::SignalKind::INTERNAL);
	}
}

void WaveformRecorder::onAfterPowerOn()
{
	LOTCTL_ASSERT_HINT(!m_initialized, "Waveform recorders can only record a single power on.");
	initializeStates();
	initialize();
	m_initialized = true;
}

void WaveformRecorder::initializeStates()
{
	m_trackedState.resize(m_id2Signal.size());
	for (auto id : utils::Range(m_id2Signal.size()))
		m_trackedState[id] = m_simulator.getValueOfSignal(m_id2Signal[id].signal);
}

void WaveformRecorder::onCommitState()
{
	if (!m_initialized) return;

	for (auto id : utils::Range(m_id2Signal.size())) {
		std::uint64_t newState = m_simulator.getValueOfSignal(m_id2Signal[id].signal);
		if (newState != m_trackedState[id]) {
			m_trackedState[id] = newState;
			signalChanged(id);
		}
	}
}

void WaveformRecorder::onNewTick(const hlim::ClockRational &simulationTime)
{
	if (m_initialized)
		advanceTick(simulationTime);
}

}
