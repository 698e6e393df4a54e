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
#include "Exceptions.h"

#include <boost/lexical_cast.hpp>

namespace lotctl::utils {

template class LotctlError<std::logic_error>;
template class LotctlError<std::runtime_error>;

std::string composeErrorString(const char *file, size_t line, const std::string &what)
{
	return what + " Location: " + file + '('+boost::lexical_cast<std::string>(line)+')';
}

InternalError::InternalError(const char *file, size_t line, const std::string &what) : LotctlError<std::logic_error>(file, line, what) { }
InternalError::~InternalError() { }

DesignError::DesignError(const char *file, size_t line, const std::string &what) : LotctlError<std::runtime_error>(file, line, what) { }
DesignError::~DesignError() { }

}
