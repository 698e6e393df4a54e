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
#include "DebugInterface.h"

#include "../hlim/Node.h"
#include "../hlim/NodeGroup.h"

#include <magic_enum.hpp>

#include <iostream>
#include <sstream>

namespace lotctl::dbg {

thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();


ConsoleInterface::ConsoleInterface(LogMessage::Severity minSeverity) : m_minSeverity(minSeverity)
{
}

void ConsoleInterface::log(LogMessage msg)
{
	if (msg.severity() < m_minSeverity)
		return;

	std::clog << format(msg) << std::endl;
}

std::string ConsoleInterface::format(const LogMessage &msg)
{
	std::stringstream line;
	line << '[' << magic_enum::enum_name(msg.severity()) << "][" << magic_enum::enum_name(msg.source()) << ']';

	if (msg.anchor() != nullptr) {
		std::string path = msg.anchor()->instancePath();
		line << '[' << (path.empty() ? msg.anchor()->getName() : path) << ']';
	}
	line << ' ';

	for (const auto &part : msg.parts()) {
		std::visit([&](const auto &v) {
			using Type = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<Type, const hlim::BaseNode*>) {
				if (v == nullptr)
					line << "<null node>";
				else
					line << v->getTypeName() << " '" << v->getName() << '\'';
			} else if constexpr (std::is_same_v<Type, const hlim::NodeGroup*>) {
				if (v == nullptr)
					line << "<null group>";
				else
					line << v->getInstanceName();
			} else
				line << v;
		}, part);
	}

	return line.str();
}


void logConsole(LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<ConsoleInterface>(minSeverity);
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

}
