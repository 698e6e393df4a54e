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

#include <string>

/// Internal invariant of the model or simulator, throws lotctl::utils::InternalError.
#define LOTCTL_ASSERT(x) { if (!(x)) { throw lotctl::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define LOTCTL_ASSERT_HINT(x, message) { if (!(x)) { throw lotctl::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}

/// Invalid design parameters or simulator usage, throws lotctl::utils::DesignError.
#define LOTCTL_DESIGNCHECK(x) { if (!(x)) { throw lotctl::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x); }}
#define LOTCTL_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw lotctl::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}
