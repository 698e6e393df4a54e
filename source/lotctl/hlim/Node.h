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

#include "SignalRef.h"

#include "../utils/StackTrace.h"
#include "../utils/CppTools.h"
#include "../utils/Exceptions.h"

#include <cstdint>
#include <string>
#include <vector>

namespace lotctl::sim {

class SimulatorCallbacks;
class DataState;

}

namespace lotctl::hlim {

class NodeGroup;
class Clock;
class Circuit;

/**
 * @brief Base class of all nodes of the circuit graph.
 * @details A node reads the signals bound to its input ports and drives one signal per output port.
 * Clocked nodes update their outputs and internal state on the triggering edge of their clock through
 * simulateAdvance, combinatorial nodes recompute their outputs whenever simulateEvaluate is called.
 */
class BaseNode
{
	public:
		BaseNode();
		BaseNode(size_t numInputs, size_t numOutputs);
		virtual ~BaseNode();

		virtual std::string getTypeName() const = 0;
		virtual std::string getInputName(size_t idx) const = 0;
		virtual std::string getOutputName(size_t idx) const = 0;

		/// Returns a list of word sizes of all the words of internal state that the node needs for simulation.
		virtual std::vector<size_t> getInternalStateSizes() const { return {}; }

		/// Brings outputs and internal state into their power-on state.
		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const { }
		/// Recomputes the outputs of a combinatorial node from its inputs.
		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const { }
		/// @brief Computes the post-edge outputs and internal state of a clocked node.
		/// @details Reads exclusively from current (the pre-edge state) and writes exclusively its own signals in next.
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const { }

		inline size_t getNumInputPorts() const { return m_inputs.size(); }
		inline size_t getNumOutputPorts() const { return m_outputWidths.size(); }

		void connectInput(size_t inputPort, SignalRef driver);
		inline SignalRef getDriver(size_t inputPort) const { return m_inputs[inputPort]; }
		inline size_t getOutputWidth(size_t outputPort) const { return m_outputWidths[outputPort]; }
		inline SignalRef getOutput(size_t outputPort) const { return m_outputs[outputPort]; }
		inline SignalRef getInternal(size_t idx) const { return m_internal[idx]; }

		/// Returns true if all inputs are bound to a signal.
		bool inputsConnected() const;

		inline bool isClocked() const { return m_clock != nullptr; }
		/// Returns true if the synchronous reset of the node's clock is asserted in the given state.
		bool resetAsserted(const sim::DataState &state) const;
		inline Clock *getClock() const { return m_clock; }

		inline void recordStackTrace() { m_stackTrace.record(10, 1); }
		inline const utils::StackTrace &getStackTrace() const { return m_stackTrace; }

		inline void setName(std::string name) { m_name = std::move(name); }
		inline const std::string &getName() const { return m_name; }

		const NodeGroup *getGroup() const { return m_nodeGroup; }
		NodeGroup *getGroup() { return m_nodeGroup; }
		void moveToGroup(NodeGroup *group);

		/// Returns an id that is unique to this node within the circuit and reflects creation order.
		inline std::uint64_t getId() const { LOTCTL_ASSERT(m_nodeId != ~0ull); return m_nodeId; }
		void setId(std::uint64_t id, utils::RestrictTo<Circuit>) { m_nodeId = id; }

		void bindSignals(std::vector<SignalRef> outputs, std::vector<SignalRef> internal, utils::RestrictTo<Circuit>);
	protected:
		std::uint64_t m_nodeId = ~0ull;

		std::string m_name;
		utils::StackTrace m_stackTrace;
		NodeGroup *m_nodeGroup = nullptr;
		Clock *m_clock = nullptr;

		std::vector<SignalRef> m_inputs;
		std::vector<size_t> m_outputWidths;
		std::vector<SignalRef> m_outputs;
		std::vector<SignalRef> m_internal;

		void resizeInputs(size_t num) { m_inputs.resize(num); }
		void resizeOutputs(size_t num) { m_outputWidths.resize(num, 1); }
		void setOutputWidth(size_t outputPort, size_t width);
		void attachClock(Clock *clk) { m_clock = clk; }
};

}
