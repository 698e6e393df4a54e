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

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lotctl::hlim {

	class BaseNode;

	/**
	 * @brief Named hierarchy level of a circuit (an entity in vhdl terms).
	 * @details Used for naming signals in waveforms and for anchoring log messages.
	 */
	class NodeGroup
	{
	public:
		NodeGroup(std::string_view name, NodeGroup *parent);

		NodeGroup *addChildNodeGroup(std::string_view name);

		NodeGroup *getParent() { return m_parent; }
		const NodeGroup *getParent() const { return m_parent; }
		const std::string &getName() const { return m_name; }
		const std::string &getInstanceName() const { return m_instanceName; }
		const std::vector<BaseNode*> &getNodes() const { return m_nodes; }

		/// Slash separated instance names from the root group (exclusive) down to this group.
		std::string instancePath() const;

		void addNode(BaseNode *node) { m_nodes.push_back(node); }
		void removeNode(BaseNode *node);
	protected:
		std::string m_name;
		std::string m_instanceName;
		NodeGroup *m_parent = nullptr;

		std::vector<BaseNode*> m_nodes;
		std::vector<std::unique_ptr<NodeGroup>> m_children;
	};

}
