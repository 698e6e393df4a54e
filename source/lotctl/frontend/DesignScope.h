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

#include "../hlim/Circuit.h"
#include "../utils/Preprocessor.h"

#include "Scope.h"

#include <string_view>

namespace lotctl {

/**
 * @addtogroup lotctl_scopes
 * @{
 */

/**
 * @brief Owns the circuit under construction.
 * @details Components build into the innermost design scope, the root node group is entered for
 * the scope's lifetime. Clocks and pins need an open design scope as well.
 */
class DesignScope : public BaseScope<DesignScope>
{
	public:
		DesignScope(std::string_view topName = "top");

		static DesignScope *get() { return m_currentScope; }
		hlim::Circuit &getCircuit() { return m_circuit; }
		const hlim::Circuit &getCircuit() const { return m_circuit; }

		template<typename NodeType, typename... Args>
		static NodeType *createNode(Args&&... args);

		template<typename ClockType, typename... Args>
		static ClockType *createClock(Args&&... args);
	protected:
		hlim::Circuit m_circuit;
		GroupScope m_rootScope;
};

template<typename NodeType, typename... Args>
NodeType *DesignScope::createNode(Args&&... args) {
	LOTCTL_DESIGNCHECK_HINT(m_currentScope != nullptr, "Nodes can only be created inside a design scope.");
	LOTCTL_ASSERT(GroupScope::getCurrentNodeGroup() != nullptr);

	NodeType *node = m_currentScope->m_circuit.template createNode<NodeType>(std::forward<Args>(args)...);
	node->recordStackTrace();
	node->moveToGroup(GroupScope::getCurrentNodeGroup());
	return node;
}

template<typename ClockType, typename... Args>
ClockType *DesignScope::createClock(Args&&... args) {
	LOTCTL_DESIGNCHECK_HINT(m_currentScope != nullptr, "Clocks can only be created inside a design scope.");
	return m_currentScope->m_circuit.template createClock<ClockType>(std::forward<Args>(args)...);
}

/** @}*/

}
