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
#include "Node.h"
#include "Clock.h"
#include "NodeGroup.h"

#include "../utils/CppTools.h"

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lotctl::hlim {

	enum class SignalKind {
		PIN_IN,
		REGISTER,
		COMBINATORIAL,
		INTERNAL
	};

	/// Entry of the signal table of a circuit, one per simulation state word.
	struct SignalInfo {
		std::string name;
		size_t width = 1;
		SignalKind kind = SignalKind::COMBINATORIAL;
		/// Group of signals without driver (input pins), otherwise the driver's group is used.
		NodeGroup *group = nullptr;
		BaseNode *driver = nullptr;
		/// Explicitly named signals are exported in waveforms under their name and can be looked up by name.
		bool named = false;
	};

	struct OutputPin {
		std::string name;
		SignalRef signal;
	};

	class Circuit
	{
	public:
		Circuit(std::string_view topName = "top");
		~Circuit();

		Circuit(const Circuit&) = delete;
		Circuit &operator=(const Circuit&) = delete;

		/// @brief Creates a node and allocates the signals for its outputs and internal state.
		/// @details Outputs of clocked nodes become registers, outputs of unclocked nodes become combinatorial signals.
		template<std::derived_from<BaseNode> NodeType, typename... Args>
		NodeType *createNode(Args&&... args);

		template<typename ClockType, typename... Args>
		ClockType *createClock(Args&&... args);

		SignalRef createPinIn(std::string_view name, size_t width, NodeGroup *group);
		void addOutputPin(std::string_view name, SignalRef signal);
		/// Makes a signal visible under the given name in waveforms and to findSignal.
		void nameSignal(SignalRef signal, std::string_view name);

		/// Finds input pins, output pins and named signals by name.
		std::optional<SignalRef> findSignal(std::string_view name) const;

		inline NodeGroup *getRootNodeGroup() { return m_root.get(); }
		inline const NodeGroup *getRootNodeGroup() const { return m_root.get(); }

		inline const std::vector<std::unique_ptr<BaseNode>> &getNodes() const { return m_nodes; }
		inline const std::vector<std::unique_ptr<Clock>> &getClocks() const { return m_clocks; }
		inline const std::vector<SignalInfo> &getSignals() const { return m_signals; }
		inline const std::vector<OutputPin> &getOutputPins() const { return m_outputPins; }

		const SignalInfo &getSignal(SignalRef signal) const;
		/// Group in which the signal lives, either its driver's or, for pins, the one it was created in.
		const NodeGroup *getSignalGroup(SignalRef signal) const;
	protected:
		std::vector<std::unique_ptr<BaseNode>> m_nodes;
		std::vector<std::unique_ptr<Clock>> m_clocks;
		std::vector<SignalInfo> m_signals;
		std::vector<OutputPin> m_outputPins;
		std::unique_ptr<NodeGroup> m_root;

		SignalRef allocateSignal(SignalInfo info);
		void bindNodeSignals(BaseNode *node);
	};


	template<std::derived_from<BaseNode> NodeType, typename... Args>
	NodeType *Circuit::createNode(Args&&... args) {
		m_nodes.push_back(std::make_unique<NodeType>(std::forward<Args>(args)...));
		m_nodes.back()->setId(m_nodes.size()-1, {});
		bindNodeSignals(m_nodes.back().get());
		return (NodeType*)m_nodes.back().get();
	}

	template<typename ClockType, typename... Args>
	ClockType *Circuit::createClock(Args&&... args) {
		m_clocks.push_back(std::make_unique<ClockType>(std::forward<Args>(args)...));
		m_clocks.back()->setId(m_clocks.size()-1, {});
		return (ClockType*)m_clocks.back().get();
	}

}
