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

#include "Simulator.h"

#include <queue>
#include <vector>

namespace lotctl::hlim {
	class BaseNode;
}

namespace lotctl::sim {

/**
 * @brief Event driven, cycle accurate simulator of a circuit.
 * @details Root clocks start low and produce their first rising edge after half a period.
 * On a triggering edge, all clocked nodes of the clock read the pre-edge state and write the post-edge
 * state, which is committed atomically before the combinatorial network is reevaluated.
 */
class ReferenceSimulator : public Simulator
{
	public:
		ReferenceSimulator();

		virtual void compileProgram(const hlim::Circuit &circuit) override;

		virtual void powerOn() override;
		virtual void reevaluate() override;
		virtual void commitState() override;
		virtual void advanceEvent() override;
		virtual void advance(hlim::ClockRational seconds) override;
		virtual void advanceCycles(const hlim::Clock *clock, size_t numCycles) override;
		virtual void abort() override { m_abortCalled = true; }
		virtual bool abortCalled() const override { return m_abortCalled; }

		virtual void setInputPin(hlim::SignalRef pin, std::uint64_t value) override;

		virtual std::uint64_t getValueOfSignal(hlim::SignalRef signal) const override;
		virtual bool getValueOfClock(const hlim::Clock *clk) const override;
		virtual bool getValueOfReset(const hlim::Clock *clk) const override;
		virtual size_t getClockCycles(const hlim::Clock *clk) const override;

		const std::vector<const hlim::BaseNode*> &getCombinatorialOrder() const { return m_combinatorialNodes; }
	protected:
		struct ClockDomain {
			const hlim::Clock *clock = nullptr;
			std::vector<const hlim::BaseNode*> clockedNodes;
			bool value = false;
			size_t cycles = 0;
		};

		struct Event {
			hlim::ClockRational timeOfEvent;
			size_t clockDomain;
			bool risingEdge;

			/// Ordered such that std::priority_queue yields the earliest event first.
			bool operator<(const Event &rhs) const {
				if (timeOfEvent != rhs.timeOfEvent)
					return hlim::clockMore(timeOfEvent, rhs.timeOfEvent);
				return clockDomain > rhs.clockDomain;
			}
		};

		const hlim::Circuit *m_circuit = nullptr;
		std::vector<ClockDomain> m_clockDomains;
		std::vector<const hlim::BaseNode*> m_combinatorialNodes;
		std::vector<const hlim::Clock*> m_resetClocks;
		std::priority_queue<Event> m_events;

		DataState m_state;
		DataState m_nextState;

		bool m_stateNeedsCommitting = false;
		bool m_abortCalled = false;

		void sortCombinatorialNodes();
		void triggerClock(size_t clockDomain, bool risingEdge);
		void propagateDerivedClocks();
		void checkCompiled() const;
};

}
