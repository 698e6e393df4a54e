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

#include "DataState.h"
#include "SimulatorCallbacks.h"

#include "../hlim/ClockRational.h"
#include "../hlim/SignalRef.h"

#include <cstdint>
#include <vector>

namespace lotctl::hlim {
	class Circuit;
	class Clock;
}

namespace lotctl::sim {

/**
 * @brief Interface for all logic simulators
 */
class Simulator
{
	public:
		Simulator() = default;
		virtual ~Simulator() = default;

		/// Adds a simulator callback hook to inform waveform recorders and test benches about simulation events.
		void addCallbacks(SimulatorCallbacks *simCallbacks) { m_callbackDispatcher.m_callbacks.push_back(simCallbacks); }

		/**
		 * @brief Prepares the simulator for the simulation of the given circuit.
		 * @details The circuit must outlive the simulation.
		 */
		virtual void compileProgram(const hlim::Circuit &circuit) = 0;

		/** 
			@name Simulator control
		 	@{
		*/

		/// Reset circuit into the power-on state
		virtual void powerOn() = 0;

		/// Forces a reevaluation of all combinatorics.
		virtual void reevaluate() = 0;

		/// Declare current state the final state for this time step. 
		/// @details Triggers waveform recorders and observers.
		virtual void commitState() = 0;

		/**
		 * @brief Advance simulation to the next event
		 * @details First moves the simulation time to the next event, then announces the new
		 * time tick through SimulatorCallbacks::onNewTick. For every clock edge scheduled at that time, all registers
		 * of the clock advance from the pre-edge state (if the clock is triggering on that edge), SimulatorCallbacks::onClock
		 * is announced and the combinatorial network is reevaluated. Derived clocks whose driving signal changed
		 * produce their edges within the same time step.
		 */
		virtual void advanceEvent() = 0;

		/**
		 * @brief Advance simulation by given amount of time or until aborted.
		 * @param seconds Amount of time (in seconds) by which the simulation gets advanced.
		 */
		virtual void advance(hlim::ClockRational seconds) = 0;

		/**
		 * @brief Advance simulation until the given clock triggered numCycles more times or until aborted.
		 */
		virtual void advanceCycles(const hlim::Clock *clock, size_t numCycles) = 0;

		/**
		 * @brief Aborts a running simulation mid step
		 * @details This immediately aborts calls to advance() and advanceCycles() after the current event.
		 */
		virtual void abort() = 0;

		/**
		 * @return returns whether abort() has been called
		*/
		virtual bool abortCalled() const = 0;

		/// @}

		/** 
			@name Simulator IO
		 	@{
		*/

		/// @brief Sets the value of an input pin. 
		/// @details Combinatorics are reevaluated immediately, the new state is committed before the next event.
		virtual void setInputPin(hlim::SignalRef pin, std::uint64_t value) = 0;

		virtual std::uint64_t getValueOfSignal(hlim::SignalRef signal) const = 0;
		virtual bool getValueOfClock(const hlim::Clock *clk) const = 0;
		virtual bool getValueOfReset(const hlim::Clock *clk) const = 0;
		/// Number of triggering edges the clock had since power on.
		virtual size_t getClockCycles(const hlim::Clock *clk) const = 0;

		/// @}

		/// Returns the elapsed simulation time (in seconds) since @ref powerOn.
		inline const hlim::ClockRational &getCurrentSimulationTime() const { return m_simulationTime; }

		void onDebugMessage(const hlim::BaseNode *src, std::string msg) { m_callbackDispatcher.onDebugMessage(src, std::move(msg)); }
		void onWarning(const hlim::BaseNode *src, std::string msg) { m_callbackDispatcher.onWarning(src, std::move(msg)); }
		void onAssert(const hlim::BaseNode *src, std::string msg) { m_callbackDispatcher.onAssert(src, std::move(msg)); }
	protected:
		class CallbackDispatcher : public SimulatorCallbacks {
			public:
				std::vector<SimulatorCallbacks*> m_callbacks;

				virtual void onPowerOn() override;
				virtual void onAfterPowerOn() override;
				virtual void onCommitState() override;
				virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
				virtual void onClock(const hlim::Clock *clock, bool risingEdge) override;
				virtual void onReset(const hlim::Clock *clock, bool resetAsserted) override;
				virtual void onDebugMessage(const hlim::BaseNode *src, std::string msg) override;
				virtual void onWarning(const hlim::BaseNode *src, std::string msg) override;
				virtual void onAssert(const hlim::BaseNode *src, std::string msg) override;
			protected:
				template<typename... Params, typename... Args>
				void forward(void (SimulatorCallbacks::*hook)(Params...), Args&&... args) {
					for (auto *c : m_callbacks)
						(c->*hook)(args...);
				}
		};

		hlim::ClockRational m_simulationTime;
		CallbackDispatcher m_callbackDispatcher;
};

}
