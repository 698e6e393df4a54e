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
#include "VCDSink.h"

#include "../../hlim/NodeGroup.h"
#include "../../hlim/Circuit.h"
#include "../../hlim/Node.h"
#include "../../utils/Range.h"
#include "../../utils/Preprocessor.h"
#include "../../utils/Exceptions.h"
#include "../Simulator.h"

namespace lotctl::sim
{
	namespace {
		// Printable ascii range allowed for identifier codes
		const char CODE_FIRST = '!';
		const char CODE_LAST = '~';

		const char *MESSAGE_LABELS[] = { "Debug_Messages", "Warnings", "Asserts" };
		const char *MESSAGE_KIND_NAMES[] = { "debug", "warning", "assert" };
	}

	VCDSink::VCDSink(const hlim::Circuit &circuit, Simulator &simulator, const std::filesystem::path &filename,
					const std::optional<std::filesystem::path> &logFilename) :
		WaveformRecorder(circuit, simulator),
		m_VCD(filename)
	{
		if (logFilename) {
			if (logFilename->has_parent_path())
				std::filesystem::create_directories(logFilename->parent_path());
			m_logFile.open(*logFilename, std::ofstream::binary);
			LOTCTL_DESIGNCHECK_HINT(m_logFile.is_open(), "Could not open log file " + logFilename->string() + " for writing.");
		}
	}

	VCDSink &VCDSink::recordMessages(bool debug, bool warnings, bool asserts)
	{
		LOTCTL_DESIGNCHECK_HINT(!m_initialized, "Message tracks must be chosen before power on.");
		m_recordMessage[DEBUG] = debug;
		m_recordMessage[WARNING] = warnings;
		m_recordMessage[ASSERT] = asserts;
		return *this;
	}

	std::string VCDSink::nextCode()
	{
		const size_t base = CODE_LAST - CODE_FIRST + 1;

		std::string code;
		size_t idx = m_nextCode++;
		do {
			code.push_back(char(CODE_FIRST + idx % base));
			idx /= base;
		} while (idx != 0);
		return code;
	}

	void VCDSink::message(MessageKind kind, const hlim::BaseNode *src, const std::string &msg)
	{
		if (m_logFile.is_open()) {
			hlim::formatTime(m_logFile, m_simulator.getCurrentSimulationTime());
			m_logFile << ' ' << MESSAGE_KIND_NAMES[kind];
			if (src != nullptr)
				m_logFile << " from " << src->getTypeName() << ' ' << src->getName();
			m_logFile << ": " << msg << '\n';
		}

		if (m_initialized && m_recordMessage[kind])
			m_VCD.writeString(m_messageCode[kind], msg);
	}

	void VCDSink::onDebugMessage(const hlim::BaseNode *src, std::string msg) { message(DEBUG, src, msg); }
	void VCDSink::onWarning(const hlim::BaseNode *src, std::string msg) { message(WARNING, src, msg); }
	void VCDSink::onAssert(const hlim::BaseNode *src, std::string msg) { message(ASSERT, src, msg); }

	void VCDSink::declareModule(const Module &module)
	{
		for (const auto &[name, sub] : module.subModules) {
			auto scope = m_VCD.beginModule(name);
			declareModule(sub);
		}

		std::vector<size_t> hidden;
		for (auto id : module.signals) {
			if (m_id2Signal[id].isHidden)
				hidden.push_back(id);
			else
				m_VCD.declareWire(m_id2Signal[id].signal.width, m_id2sigCode[id], m_id2Signal[id].name);
		}

		if (!hidden.empty()) {
			auto scope = m_VCD.beginModule("__hidden");
			for (auto id : hidden)
				m_VCD.declareWire(m_id2Signal[id].signal.width, m_id2sigCode[id], m_id2Signal[id].name);
		}
	}

	void VCDSink::initialize()
	{
		Module root;
		m_id2sigCode.resize(m_id2Signal.size());
		for (auto id : utils::Range(m_id2Signal.size())) {
			m_id2sigCode[id] = nextCode();

			std::vector<const hlim::NodeGroup*> path;
			for (const hlim::NodeGroup *grp = m_id2Signal[id].nodeGroup; grp != nullptr; grp = grp->getParent())
				path.push_back(grp);

			Module *module = &root;
			for (auto it = path.rbegin(); it != path.rend(); ++it)
				module = &module->subModules[(*it)->getInstanceName()];
			module->signals.push_back(id);
		}

		declareModule(root);

		{
			auto scope = m_VCD.beginModule("clocks");
			for (const auto &clk : m_circuit.getClocks()) {
				auto &code = m_clock2code[clk.get()] = nextCode();
				m_VCD.declareWire(1, code, clk->getName());
			}
			for (const auto &clk : m_circuit.getClocks()) {
				if (clk->getParentClock() != nullptr || !clk->getResetSignal().valid())
					continue;
				auto &code = m_rst2code[clk.get()] = nextCode();
				m_VCD.declareWire(1, code, clk->getResetName());
			}
		}

		if (m_recordMessage[DEBUG] || m_recordMessage[WARNING] || m_recordMessage[ASSERT]) {
			auto scope = m_VCD.beginModule("messages");
			for (auto kind : utils::Range<size_t>(NUM_MESSAGE_KINDS)) {
				if (!m_recordMessage[kind])
					continue;
				m_messageCode[kind] = nextCode();
				m_VCD.declareString(m_messageCode[kind], MESSAGE_LABELS[kind]);
			}
		}

		auto dumpvars = m_VCD.beginDumpVars();
		for (const auto &[clock, code] : m_clock2code)
			m_VCD.writeBitState(code, m_simulator.getValueOfClock(clock));
		for (const auto &[clock, code] : m_rst2code)
			m_VCD.writeBitState(code, m_simulator.getValueOfReset(clock));
		for (auto id : utils::Range(m_id2Signal.size()))
			signalChanged(id);
	}

	void VCDSink::signalChanged(size_t id)
	{
		const auto &signal = m_id2Signal[id].signal;
		if (signal.width == 1)
			m_VCD.writeBitState(m_id2sigCode[id], m_trackedState[id] & 1);
		else
			m_VCD.writeState(m_id2sigCode[id], signal.width, m_trackedState[id]);
	}

	void VCDSink::advanceTick(const hlim::ClockRational &simulationTime)
	{
		hlim::ClockRational picoseconds = simulationTime * hlim::ClockRational(1'000'000'000'000ull, 1);
		m_VCD.writeTime(picoseconds.numerator() / picoseconds.denominator());
	}

	void VCDSink::onClock(const hlim::Clock *clock, bool risingEdge)
	{
		if (!m_initialized) return;
		if (auto it = m_clock2code.find(clock); it != m_clock2code.end())
			m_VCD.writeBitState(it->second, risingEdge);
	}

	void VCDSink::onReset(const hlim::Clock *clock, bool inReset)
	{
		if (!m_initialized) return;
		if (auto it = m_rst2code.find(clock); it != m_rst2code.end())
			m_VCD.writeBitState(it->second, inReset);
	}

	void VCDSink::onCommitState()
	{
		WaveformRecorder::onCommitState();

		if (m_commitCounter++ % 128 == 0)
			m_VCD.flush();
	}

}
