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

#include "../WaveformRecorder.h"
#include "VCDWriter.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lotctl::hlim {
	class Clock;
}

namespace lotctl::sim {

/**
 * @brief Records a simulation run into a VCD file.
 * @details Signals are grouped into modules following the node group hierarchy. Clocks and resets
 * go to a "clocks" module, simulator messages to string tracks in a "messages" module. A plain
 * text log of all messages can be written alongside.
 */
class VCDSink : public WaveformRecorder
{
	public:
		VCDSink(const hlim::Circuit &circuit, Simulator &simulator, const std::filesystem::path &filename,
				const std::optional<std::filesystem::path> &logFilename = {});

		virtual void onDebugMessage(const hlim::BaseNode *src, std::string msg) override;
		virtual void onWarning(const hlim::BaseNode *src, std::string msg) override;
		virtual void onAssert(const hlim::BaseNode *src, std::string msg) override;
		virtual void onClock(const hlim::Clock *clock, bool risingEdge) override;
		virtual void onReset(const hlim::Clock *clock, bool inReset) override;
		virtual void onCommitState() override;

		/// Toggles the string tracks for debug messages, warnings and asserts. Must be set before power on.
		VCDSink &recordMessages(bool debug, bool warnings, bool asserts);
	protected:
		enum MessageKind { DEBUG, WARNING, ASSERT, NUM_MESSAGE_KINDS };

		struct Module {
			std::map<std::string, Module> subModules;
			std::vector<size_t> signals;
		};

		VCDWriter m_VCD;
		std::ofstream m_logFile;

		size_t m_nextCode = 0;
		std::vector<std::string> m_id2sigCode;
		std::map<const hlim::Clock*, std::string> m_clock2code;
		std::map<const hlim::Clock*, std::string> m_rst2code;

		bool m_recordMessage[NUM_MESSAGE_KINDS] = { true, true, true };
		std::string m_messageCode[NUM_MESSAGE_KINDS];
		size_t m_commitCounter = 0;

		virtual void initialize() override;
		virtual void signalChanged(size_t id) override;
		virtual void advanceTick(const hlim::ClockRational &simulationTime) override;

		std::string nextCode();
		void declareModule(const Module &module);
		void message(MessageKind kind, const hlim::BaseNode *src, const std::string &msg);
};

}
