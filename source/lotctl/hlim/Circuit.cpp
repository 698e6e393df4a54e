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
#include "Circuit.h"

#include "../utils/Range.h"

namespace lotctl::hlim {

Circuit::Circuit(std::string_view topName)
{
	m_root.reset(new NodeGroup(topName, nullptr));
}

Circuit::~Circuit()
{
	// Nodes deregister from their groups on destruction
	m_nodes.clear();
}

SignalRef Circuit::allocateSignal(SignalInfo info)
{
	LOTCTL_DESIGNCHECK_HINT(info.width >= 1 && info.width <= 64, "Signals must be between 1 and 64 bits wide.");

	SignalRef ref{ .index = m_signals.size(), .width = info.width };
	m_signals.push_back(std::move(info));
	return ref;
}

void Circuit::bindNodeSignals(BaseNode *node)
{
	std::vector<SignalRef> outputs;
	outputs.reserve(node->getNumOutputPorts());
	for (auto i : utils::Range(node->getNumOutputPorts()))
		outputs.push_back(allocateSignal({
			.name = node->getOutputName(i),
			.width = node->getOutputWidth(i),
			.kind = node->isClocked() ? SignalKind::REGISTER : SignalKind::COMBINATORIAL,
			.driver = node,
		}));

	std::vector<SignalRef> internal;
	auto internalSizes = node->getInternalStateSizes();
	internal.reserve(internalSizes.size());
	for (auto i : utils::Range(internalSizes.size()))
		internal.push_back(allocateSignal({
			.name = node->getTypeName() + "_state" + std::to_string(i),
			.width = internalSizes[i],
			.kind = SignalKind::INTERNAL,
			.driver = node,
		}));

	node->bindSignals(std::move(outputs), std::move(internal), {});
}

SignalRef Circuit::createPinIn(std::string_view name, size_t width, NodeGroup *group)
{
	return allocateSignal({
		.name = std::string(name),
		.width = width,
		.kind = SignalKind::PIN_IN,
		.group = group,
		.named = true,
	});
}

void Circuit::addOutputPin(std::string_view name, SignalRef signal)
{
	LOTCTL_ASSERT(signal.valid() && signal.index < m_signals.size());
	LOTCTL_DESIGNCHECK_HINT(!findSignal(name), "The name " + std::string(name) + " is already in use by another pin or named signal.");
	m_outputPins.push_back({ std::string(name), signal });
}

void Circuit::nameSignal(SignalRef signal, std::string_view name)
{
	LOTCTL_ASSERT(signal.valid() && signal.index < m_signals.size());
	auto existing = findSignal(name);
	LOTCTL_DESIGNCHECK_HINT(!existing || *existing == signal, "The name " + std::string(name) + " is already in use by another pin or named signal.");

	auto &info = m_signals[signal.index];
	info.name = name;
	info.named = true;
}

std::optional<SignalRef> Circuit::findSignal(std::string_view name) const
{
	for (const auto &pin : m_outputPins)
		if (pin.name == name)
			return pin.signal;

	for (auto i : utils::Range(m_signals.size()))
		if (m_signals[i].named && m_signals[i].name == name)
			return SignalRef{ .index = i, .width = m_signals[i].width };

	return {};
}

const SignalInfo &Circuit::getSignal(SignalRef signal) const
{
	LOTCTL_ASSERT(signal.valid() && signal.index < m_signals.size());
	return m_signals[signal.index];
}

const NodeGroup *Circuit::getSignalGroup(SignalRef signal) const
{
	const auto &info = getSignal(signal);
	if (info.driver != nullptr)
		return info.driver->getGroup();
	return info.group;
}

}
