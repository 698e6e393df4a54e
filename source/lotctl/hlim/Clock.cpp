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
#include "Clock.h"

namespace lotctl::hlim {

Clock::Clock()
{
}

Clock::~Clock()
{
}

SignalRef Clock::getResetSignal() const
{
	if (!m_resetSignal.valid() && m_parentClock != nullptr)
		return m_parentClock->getResetSignal();
	return m_resetSignal;
}


RootClock::RootClock(std::string name, ClockRational frequency) : m_frequency(frequency)
{
	LOTCTL_DESIGNCHECK_HINT(frequency.numerator() != 0, "Clock frequency must be larger than zero.");
	m_name = std::move(name);
	m_resetName = m_name + "_reset";
}


DerivedClock::DerivedClock(Clock *parentClock)
{
	LOTCTL_ASSERT(parentClock != nullptr);
	m_parentClock = parentClock;
	m_name = parentClock->getName() + "_derived";
	m_resetName = parentClock->getResetName();
	m_triggerEvent = parentClock->getTriggerEvent();
}

ClockRational DerivedClock::absoluteFrequency() const
{
	return m_parentClock->absoluteFrequency() * m_parentRelativeMultiplicator;
}

void DerivedClock::setLogicClockDriver(SignalRef driver)
{
	LOTCTL_DESIGNCHECK_HINT(driver.width == 1, "Clocks can only be driven by single bit signals.");
	m_logicClockDriver = driver;
}

}
