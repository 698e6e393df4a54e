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

#include <boost/stacktrace.hpp>

#include <vector>
#include <string>
#include <ostream>


namespace lotctl::utils {

	class StackTrace
	{
	public:
		void record(size_t size, size_t skipTop);
		std::vector<std::string> formatEntries() const;
		std::vector<std::string> formatEntriesFiltered() const;
	protected:
		std::vector<boost::stacktrace::frame> m_trace;
	};

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace);
}
