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
#include "ReferenceSimulator.h"

#include "../hlim/Circuit.h"
#include "../utils/Range.h"
#include "../debug/DebugInterface.h"

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include <deque>

namespace lotctl::sim {

namespace {

std::string describe(const hlim::BaseNode *node)
{
	std::string result = node->getTypeName() + " " + node->getName();
	auto frames = node->getStackTrace().formatEntriesFiltered();
	if (!frames.empty())
		result += " created at\n    " + boost::algorithm::join(frames, "\n    ");
	return result;
}

}

ReferenceSimulator::ReferenceSimulator()
{
}

void ReferenceSimulator::compileProgram(const hlim::Circuit &circuit)
{
	m_circuit = &circuit;

	m_clockDomains.clear();
	m_clockDomains.resize(circuit.getClocks().size());
	m_resetClocks.clear();
	for (const auto &clk : circuit.getClocks()) {
		auto &domain = m_clockDomains[clk->getId()];
		domain.clock = clk.get();

		if (auto *derived = dynamic_cast<const hlim::DerivedClock*>(clk.get())) {
			LOTCTL_DESIGNCHECK_HINT(!derived->isSelfDriven(), "Derived clock " + clk->getName() + " has no driving signal.");
			const auto &driverInfo = circuit.getSignal(derived->getLogicClockDriver());
			LOTCTL_DESIGNCHECK_HINT(driverInfo.driver == nullptr || driverInfo.driver->getClock() != clk.get(),
						"Derived clock " + clk->getName() + " is driven from its own clock domain.");
		} else if (clk->getResetSignal().valid())
			m_resetClocks.push_back(clk.get());
	}

	m_combinatorialNodes.clear();
	for (const auto &node : circuit.getNodes()) {
		LOTCTL_DESIGNCHECK_HINT(node->inputsConnected(), "Not all inputs of " + describe(node.get()) + "\nare connected.");
		if (node->isClocked())
			m_clockDomains[node->getClock()->getId()].clockedNodes.push_back(node.get());
		else
			m_combinatorialNodes.push_back(node.get());
	}

	sortCombinatorialNodes();

	m_state.resize(circuit.getSignals().size());
	m_nextState.resize(circuit.getSignals().size());

	dbg::log(dbg::LogMessage(circuit.getRootNodeGroup()) << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
		<< "Compiled " << circuit.getNodes().size() << " nodes in " << m_clockDomains.size() << " clock domains, "
		<< circuit.getSignals().size() << " signals");
}

void ReferenceSimulator::sortCombinatorialNodes()
{
	const auto &signals = m_circuit->getSignals();
	const size_t numNodes = m_circuit->getNodes().size();

	// Indexed by node id
	std::vector<size_t> pendingInputs(numNodes, 0);
	std::vector<std::vector<const hlim::BaseNode*>> dependents(numNodes);

	for (const auto *node : m_combinatorialNodes) {
		for (auto i : utils::Range(node->getNumInputPorts())) {
			const auto &driverInfo = signals[node->getDriver(i).index];
			if (driverInfo.driver != nullptr && driverInfo.kind == hlim::SignalKind::COMBINATORIAL) {
				pendingInputs[node->getId()]++;
				dependents[driverInfo.driver->getId()].push_back(node);
			}
		}
	}

	std::deque<const hlim::BaseNode*> ready;
	for (const auto *node : m_combinatorialNodes)
		if (pendingInputs[node->getId()] == 0)
			ready.push_back(node);

	std::vector<const hlim::BaseNode*> order;
	order.reserve(m_combinatorialNodes.size());
	while (!ready.empty()) {
		const auto *node = ready.front();
		ready.pop_front();
		order.push_back(node);

		for (const auto *dep : dependents[node->getId()])
			if (--pendingInputs[dep->getId()] == 0)
				ready.push_back(dep);
	}

	if (order.size() != m_combinatorialNodes.size()) {
		for (const auto *node : m_combinatorialNodes)
			if (pendingInputs[node->getId()] != 0)
				LOTCTL_DESIGNCHECK_HINT(false, "Combinatorial loop detected involving " + describe(node));
	}

	m_combinatorialNodes = std::move(order);
}

void ReferenceSimulator::checkCompiled() const
{
	LOTCTL_DESIGNCHECK_HINT(m_circuit != nullptr, "No circuit has been compiled for simulation.");
}

void ReferenceSimulator::powerOn()
{
	checkCompiled();

	m_simulationTime = 0;
	m_abortCalled = false;
	m_stateNeedsCommitting = false;
	m_events = {};
	m_state.clear();

	m_callbackDispatcher.onPowerOn();

	for (const auto &node : m_circuit->getNodes())
		node->simulatePowerOn(m_callbackDispatcher, m_state);

	reevaluate();

	for (auto idx : utils::Range(m_clockDomains.size())) {
		auto &domain = m_clockDomains[idx];
		domain.cycles = 0;
		if (auto *derived = dynamic_cast<const hlim::DerivedClock*>(domain.clock))
			domain.value = m_state.getBit(derived->getLogicClockDriver());
		else {
			domain.value = false;
			hlim::ClockRational halfPeriod = hlim::ClockRational(1, 2) / domain.clock->absoluteFrequency();
			m_events.push({ .timeOfEvent = halfPeriod, .clockDomain = idx, .risingEdge = true });
		}
	}

	m_callbackDispatcher.onAfterPowerOn();
	m_stateNeedsCommitting = true;
}

void ReferenceSimulator::reevaluate()
{
	for (const auto *node : m_combinatorialNodes)
		node->simulateEvaluate(m_callbackDispatcher, m_state);
}

void ReferenceSimulator::commitState()
{
	m_callbackDispatcher.onCommitState();
	m_stateNeedsCommitting = false;
}

void ReferenceSimulator::triggerClock(size_t clockDomain, bool risingEdge)
{
	auto &domain = m_clockDomains[clockDomain];
	domain.value = risingEdge;

	if (domain.clock->isTriggeringEdge(risingEdge)) {
		domain.cycles++;

		m_nextState = m_state;
		for (const auto *node : domain.clockedNodes)
			node->simulateAdvance(m_callbackDispatcher, m_state, m_nextState);
		std::swap(m_state, m_nextState);
	}

	m_callbackDispatcher.onClock(domain.clock, risingEdge);

	reevaluate();
	propagateDerivedClocks();
}

void ReferenceSimulator::propagateDerivedClocks()
{
	for (auto idx : utils::Range(m_clockDomains.size())) {
		auto &domain = m_clockDomains[idx];
		auto *derived = dynamic_cast<const hlim::DerivedClock*>(domain.clock);
		if (derived == nullptr) continue;

		bool driverValue = m_state.getBit(derived->getLogicClockDriver());
		if (driverValue != domain.value)
			triggerClock(idx, driverValue);
	}
}

void ReferenceSimulator::advanceEvent()
{
	checkCompiled();

	if (m_stateNeedsCommitting)
		commitState();

	if (m_events.empty())
		return;

	m_simulationTime = m_events.top().timeOfEvent;
	m_callbackDispatcher.onNewTick(m_simulationTime);

	while (!m_events.empty() && m_events.top().timeOfEvent == m_simulationTime) {
		Event event = m_events.top();
		m_events.pop();

		hlim::ClockRational halfPeriod = hlim::ClockRational(1, 2) / m_clockDomains[event.clockDomain].clock->absoluteFrequency();
		m_events.push({ .timeOfEvent = event.timeOfEvent + halfPeriod, .clockDomain = event.clockDomain, .risingEdge = !event.risingEdge });

		triggerClock(event.clockDomain, event.risingEdge);
	}

	commitState();
}

void ReferenceSimulator::advance(hlim::ClockRational seconds)
{
	checkCompiled();

	hlim::ClockRational targetTime = m_simulationTime + seconds;

	while (!m_abortCalled) {
		if (m_events.empty() || hlim::clockMore(m_events.top().timeOfEvent, targetTime))
			break;
		advanceEvent();
	}

	if (m_stateNeedsCommitting)
		commitState();

	if (!m_abortCalled)
		m_simulationTime = targetTime;
}

void ReferenceSimulator::advanceCycles(const hlim::Clock *clock, size_t numCycles)
{
	checkCompiled();
	LOTCTL_DESIGNCHECK_HINT(clock->getId() < m_clockDomains.size() && m_clockDomains[clock->getId()].clock == clock,
				"Clock " + clock->getName() + " is not part of the simulated circuit.");

	const auto &domain = m_clockDomains[clock->getId()];
	size_t targetCycles = domain.cycles + numCycles;
	while (!m_abortCalled && domain.cycles < targetCycles && !m_events.empty())
		advanceEvent();
}

void ReferenceSimulator::setInputPin(hlim::SignalRef pin, std::uint64_t value)
{
	checkCompiled();
	const auto &info = m_circuit->getSignal(pin);
	LOTCTL_DESIGNCHECK_HINT(info.kind == hlim::SignalKind::PIN_IN, "Only input pins can be set, " + info.name + " is not an input pin.");

	if (info.width < 64 && (value >> info.width) != 0)
		m_callbackDispatcher.onWarning(nullptr, (boost::format("Value %d does not fit into the %d bits of input pin %s and is truncated.") % value % info.width % info.name).str());

	std::uint64_t oldValue = m_state.get(pin);
	m_state.set(pin, value);
	if (m_state.get(pin) == oldValue)
		return;

	for (const auto *clk : m_resetClocks)
		if (clk->getResetSignal() == pin)
			m_callbackDispatcher.onReset(clk, m_state.getBit(pin));

	reevaluate();
	propagateDerivedClocks();
	m_stateNeedsCommitting = true;
}

std::uint64_t ReferenceSimulator::getValueOfSignal(hlim::SignalRef signal) const
{
	LOTCTL_ASSERT(signal.index < m_state.size());
	return m_state.get(signal);
}

bool ReferenceSimulator::getValueOfClock(const hlim::Clock *clk) const
{
	LOTCTL_ASSERT(clk->getId() < m_clockDomains.size());
	return m_clockDomains[clk->getId()].value;
}

bool ReferenceSimulator::getValueOfReset(const hlim::Clock *clk) const
{
	auto reset = clk->getResetSignal();
	if (!reset.valid())
		return false;
	return m_state.getBit(reset);
}

size_t ReferenceSimulator::getClockCycles(const hlim::Clock *clk) const
{
	LOTCTL_ASSERT(clk->getId() < m_clockDomains.size());
	return m_clockDomains[clk->getId()].cycles;
}

}
