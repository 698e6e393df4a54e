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
#include "pch.h"
#define BOOST_TEST_MODULE "Unit tests for the parking lot controller"
#include <boost/test/unit_test.hpp>

struct LoggingGlobalFixture
{
	void setup() { lotctl::dbg::logConsole(lotctl::dbg::LogMessage::LOG_WARNING); }
	void teardown() { }
};

BOOST_TEST_GLOBAL_FIXTURE( LoggingGlobalFixture );
