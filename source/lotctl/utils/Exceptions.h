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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <stdexcept>
#include <iostream>


namespace lotctl::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);


template<class BaseError>
class LotctlError : public BaseError
{
	public:
		LotctlError(const char *file, size_t line, const std::string &what) :
				BaseError(composeErrorString(file, line, what)) {

			m_trace.record(20, 1);
		}
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class LotctlError<std::logic_error>;
extern template class LotctlError<std::runtime_error>;


/// Thrown when an internal invariant of the model or the simulator is violated.
class InternalError : public LotctlError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Thrown when a design is elaborated with invalid parameters or the simulator API is misused.
class DesignError : public LotctlError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const LotctlError<BaseError> &exception) {
	stream
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();

	return stream;
}

}
