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
#include "Scope.h"

#include <string_view>

namespace lotctl
{

/**
 * @addtogroup lotctl_scopes
 * @{
 */

	/**
	 * @brief Named hierarchy level of a component (an entity in vhdl terms).
	 * @details The area is a child of the current group and is entered for its whole lifetime.
	 * Everything a component builds inside its constructor therefore ends up in its own group,
	 * which the VCD writer turns into a module.
	 * @code
	 *	{
	 *		Area area("ClockDivider");
	 *		// nodes and pins of the divider
	 *	}
	 * @endcode
	 */
	class Area
	{
	public:
		Area(std::string_view name);

		hlim::NodeGroup* getNodeGroup() { return m_scope.nodeGroup(); }
	private:
		GroupScope m_scope;
	};

/**@}*/

}
