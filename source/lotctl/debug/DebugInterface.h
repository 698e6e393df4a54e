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

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <concepts>

namespace lotctl {

namespace hlim {
	class BaseNode;
	class NodeGroup;
}

namespace dbg {

/**
 * @brief A log message, composed with operator<< from text, numbers, nodes and node groups.
 * @details Nodes and groups are kept as references and only rendered by the backend, which
 * prints them with their type and instance path.
 *
 * @code
 * dbg::log(dbg::LogMessage(area.getNodeGroup()) << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN << "Threshold is " << threshold);
 * @endcode
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_DESIGN,
			LOG_SIMULATION,
			LOG_CONFIG
		};

		LogMessage() = default;
		/// Message in the context of the given group
		LogMessage(const hlim::NodeGroup *anchor) : m_anchor(anchor) { }

		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		LogMessage &operator<<(Source s) { m_source = s; return *this; }

		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		LogMessage &operator<<(std::size_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		/// The node must still exist when the message reaches the backend.
		LogMessage &operator<<(const hlim::BaseNode *node) { m_messageParts.push_back(node); return *this; }
		LogMessage &operator<<(const hlim::NodeGroup *group) { m_messageParts.push_back(group); return *this; }

		template<std::derived_from<hlim::BaseNode> T>
		LogMessage &operator<<(const T *v) { return *this << static_cast<const hlim::BaseNode *>(v); }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }
		const hlim::NodeGroup *anchor() const { return m_anchor; }
		const auto &parts() const { return m_messageParts; }
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_DESIGN;
		const hlim::NodeGroup *m_anchor = nullptr;

		std::vector<std::variant<const char*, std::string, const hlim::BaseNode*, const hlim::NodeGroup*>> m_messageParts;
};

/// Logging backend. The base class discards everything, so logging is off until a backend is installed.
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
};

/// Writes log messages of at least the given severity to std::clog.
class ConsoleInterface : public DebugInterface
{
	public:
		ConsoleInterface(LogMessage::Severity minSeverity);

		virtual void log(LogMessage msg) override;

		/// One line of the form "[SEVERITY][SOURCE][anchor path] text".
		static std::string format(const LogMessage &msg);
	protected:
		LogMessage::Severity m_minSeverity;
};

/// Initialize logging to write to the console.
void logConsole(LogMessage::Severity minSeverity = LogMessage::LOG_INFO);

/// Passes the message to the installed backend.
void log(const LogMessage &msg);

}

}
