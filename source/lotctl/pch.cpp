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
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/rational.hpp>

#include <vector>

namespace boost {
	template class rational<std::uint64_t>;
	template class basic_format<char>;
	template std::basic_string<char> lexical_cast<std::basic_string<char>>(const unsigned long&);
}

namespace std {
	template class std::vector<std::uint64_t>;
}
