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
#include "Node.h"
#include "NodeGroup.h"
#include "Clock.h"

#include "../simulation/DataState.h"

namespace lotctl::hlim {

BaseNode::BaseNode()
{
}

BaseNode::BaseNode(size_t numInputs, size_t numOutputs)
{
	resizeInputs(numInputs);
	resizeOutputs(numOutputs);
}

BaseNode::~BaseNode()
{
	moveToGroup(nullptr);
}

void BaseNode::connectInput(size_t inputPort, SignalRef driver)
{
	LOTCTL_ASSERT(inputPort < m_inputs.size());
	LOTCTL_DESIGNCHECK_HINT(driver.valid(), "Input " + getInputName(inputPort) + " of " + getTypeName() + " can not be bound to an invalid signal.");
	m_inputs[inputPort] = driver;
}

bool BaseNode::inputsConnected() const
{
	for (const auto &in : m_inputs)
		if (!in.valid())
			return false;
	return true;
}

bool BaseNode::resetAsserted(const sim::DataState &state) const
{
	if (m_clock == nullptr)
		return false;

	SignalRef reset = m_clock->getResetSignal();
	return reset.valid() && state.getBit(reset);
}

void BaseNode::moveToGroup(NodeGroup *group)
{
	if (group == m_nodeGroup) return;

	if (m_nodeGroup != nullptr)
		m_nodeGroup->removeNode(this);

	m_nodeGroup = group;
	if (m_nodeGroup != nullptr)
		m_nodeGroup->addNode(this);
}

void BaseNode::bindSignals(std::vector<SignalRef> outputs, std::vector<SignalRef> internal, utils::RestrictTo<Circuit>)
{
	LOTCTL_ASSERT(outputs.size() == m_outputWidths.size());
	m_outputs = std::move(outputs);
	m_internal = std::move(internal);
}

void BaseNode::setOutputWidth(size_t outputPort, size_t width)
{
	LOTCTL_DESIGNCHECK_HINT(width >= 1 && width <= 64, "Signals must be between 1 and 64 bits wide.");
	m_outputWidths[outputPort] = width;
}

}
