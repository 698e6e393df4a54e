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
#include "StackTrace.h"

#include "Range.h"

#include <boost/format.hpp>

namespace lotctl::utils
{

	void StackTrace::record(size_t size, size_t skipTop)
	{
		boost::stacktrace::stacktrace trace(skipTop, size);

		m_trace.resize(trace.size());
		for (auto i : Range(trace.size()))
			m_trace[i] = trace[i];
	}

	std::vector<std::string> StackTrace::formatEntries() const
	{
		std::vector<std::string> result;
		result.resize(m_trace.size());
		for (auto i : Range(m_trace.size()))
			result[i] = (boost::format("%s at %s:%d") % m_trace[i].name() % m_trace[i].source_file() % m_trace[i].source_line()).str();

		return result;
	}

	std::vector<std::string> StackTrace::formatEntriesFiltered() const
	{
		std::vector<std::string> result;
		for (auto &entry : formatEntries())
		{
			if (entry.starts_with("boost::"))
				continue;
			if (entry.starts_with("std::"))
				continue;
			if (entry.starts_with("lotctl::utils::"))
				continue;

			result.emplace_back(std::move(entry));
		}

		while (!result.empty())
			if (!result.back().starts_with("main "))
				result.pop_back();
			else
				break;

		return result;
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		for (const auto &entry : trace.formatEntries())
			stream << "    " << entry << '\n';
		return stream;
	}
}
