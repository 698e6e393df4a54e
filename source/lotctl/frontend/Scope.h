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

namespace lotctl {

namespace hlim {
	class NodeGroup;
}

/**
 * @addtogroup lotctl_scopes
 * @{
 */

/// Thread local stack of scopes of one kind, the innermost one is the current one.
template<class FinalType>
class BaseScope
{
	public:
		BaseScope() { m_parentScope = m_currentScope; m_currentScope = static_cast<FinalType*>(this); }
		~BaseScope() { m_currentScope = m_parentScope; }

		BaseScope(const BaseScope&) = delete;
		BaseScope &operator=(const BaseScope&) = delete;
	protected:
		FinalType *m_parentScope;
		static thread_local FinalType *m_currentScope;
};

template<class FinalType>
thread_local FinalType *BaseScope<FinalType>::m_currentScope = nullptr;

/// Nodes and pins created while the scope exists are placed into its node group.
class GroupScope : public BaseScope<GroupScope>
{
	public:
		GroupScope(hlim::NodeGroup *nodeGroup) : m_nodeGroup(nodeGroup) { }

		hlim::NodeGroup *nodeGroup() { return m_nodeGroup; }

		static hlim::NodeGroup *getCurrentNodeGroup() { return m_currentScope == nullptr ? nullptr : m_currentScope->m_nodeGroup; }
	protected:
		hlim::NodeGroup *m_nodeGroup;
};

/**@}*/

}
