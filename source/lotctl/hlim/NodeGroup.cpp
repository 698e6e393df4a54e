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
#include "NodeGroup.h"

#include <algorithm>

namespace lotctl::hlim {

NodeGroup::NodeGroup(std::string_view name, NodeGroup *parent) :
	m_name(name),
	m_instanceName(name),
	m_parent(parent)
{
}

NodeGroup *NodeGroup::addChildNodeGroup(std::string_view name)
{
	m_children.push_back(std::make_unique<NodeGroup>(name, this));

	size_t sameName = 0;
	for (const auto &c : m_children)
		if (c->getName() == name)
			sameName++;

	if (sameName > 1)
		m_children.back()->m_instanceName = std::string(name) + std::to_string(sameName - 1);

	return m_children.back().get();
}

std::string NodeGroup::instancePath() const
{
	if (m_parent == nullptr)
		return {};

	std::string parentPath = m_parent->instancePath();
	if (parentPath.empty())
		return m_instanceName;
	return parentPath + '/' + m_instanceName;
}

void NodeGroup::removeNode(BaseNode *node)
{
	auto it = std::find(m_nodes.begin(), m_nodes.end(), node);
	if (it != m_nodes.end())
		m_nodes.erase(it);
}

}
