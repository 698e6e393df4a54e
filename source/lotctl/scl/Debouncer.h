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
#include <lotctl/frontend.h>

#include <cstdint>
#include <memory>
#include <string>

namespace lotctl::scl
{
	/**
	 * @brief Filter algorithm of a debouncer.
	 * @details A filter is a pure function from the previous filter state and a new raw sample to the next filter state.
	 * The filter state is kept in a register of stateWidth() bits by the debouncer node.
	 */
	class DebounceFilter
	{
	public:
		virtual ~DebounceFilter() = default;

		virtual std::string name() const = 0;
		virtual size_t stateWidth() const = 0;
		virtual std::uint64_t powerOnState() const { return 0; }
		virtual std::uint64_t advance(std::uint64_t state, bool rawSample) const = 0;
		/// The stable level reported for a state.
		virtual bool level(std::uint64_t state) const = 0;
	};

	/// Registers the raw sample, no filtering.
	class PassThroughFilter : public DebounceFilter
	{
	public:
		virtual std::string name() const override { return "PassThrough"; }
		virtual size_t stateWidth() const override { return 1; }
		virtual std::uint64_t advance(std::uint64_t state, bool rawSample) const override { return rawSample ? 1 : 0; }
		virtual bool level(std::uint64_t state) const override { return state & 1; }
	};

	/**
	 * @brief Changes the level only after a given number of identical consecutive samples.
	 * @details Bit 0 of the state holds the level, the bits above hold the most recent samples.
	 */
	class ShiftRegisterFilter : public DebounceFilter
	{
	public:
		ShiftRegisterFilter(size_t samples);

		virtual std::string name() const override { return "ShiftRegister"; }
		virtual size_t stateWidth() const override { return m_samples + 1; }
		virtual std::uint64_t advance(std::uint64_t state, bool rawSample) const override;
		virtual bool level(std::uint64_t state) const override { return state & 1; }

		inline size_t samples() const { return m_samples; }
	protected:
		size_t m_samples;
	};

	/**
	 * @brief Saturating up/down integrator.
	 * @details Counts up on asserted samples and down on deasserted samples. The level asserts when the
	 * integrator reaches the threshold and deasserts when it reaches zero. Bit 0 of the state holds the level.
	 */
	class IntegratorFilter : public DebounceFilter
	{
	public:
		IntegratorFilter(std::uint64_t threshold);

		virtual std::string name() const override { return "Integrator"; }
		virtual size_t stateWidth() const override { return utils::bitWidthFor(m_threshold) + 1; }
		virtual std::uint64_t advance(std::uint64_t state, bool rawSample) const override;
		virtual bool level(std::uint64_t state) const override { return state & 1; }

		inline std::uint64_t threshold() const { return m_threshold; }
	protected:
		std::uint64_t m_threshold;
	};


	class Node_Debouncer : public hlim::BaseNode
	{
	public:
		enum class OutputMode {
			/// The filtered level
			LEVEL,
			/// A single cycle pulse on every rising edge of the filtered level
			PRESS_PULSE
		};

		enum Inputs {
			IN_RAW,
			NUM_INPUTS
		};
		enum Outputs {
			OUT_OUTPUT,
			NUM_OUTPUTS
		};
		enum Internal {
			INT_FILTER_STATE,
			NUM_INTERNALS
		};

		Node_Debouncer(hlim::Clock *clock, std::unique_ptr<DebounceFilter> filter, OutputMode mode);

		virtual std::string getTypeName() const override { return "Debouncer"; }
		virtual std::string getInputName(size_t idx) const override { return "raw"; }
		virtual std::string getOutputName(size_t idx) const override { return "output"; }
		virtual std::vector<size_t> getInternalStateSizes() const override { return { m_filter->stateWidth() }; }

		virtual void simulatePowerOn(sim::SimulatorCallbacks &simCallbacks, sim::DataState &state) const override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks, const sim::DataState &current, sim::DataState &next) const override;

		const DebounceFilter &getFilter() const { return *m_filter; }
		OutputMode getOutputMode() const { return m_mode; }
	protected:
		std::unique_ptr<DebounceFilter> m_filter;
		OutputMode m_mode;
	};

	/// Filters a raw, bouncing input in the clock domain of the current ClockScope.
	class Debouncer
	{
	public:
		using OutputMode = Node_Debouncer::OutputMode;

		Debouncer(std::string_view name, hlim::SignalRef raw, std::unique_ptr<DebounceFilter> filter, OutputMode mode = OutputMode::LEVEL);

		inline hlim::SignalRef output() const { return m_node->getOutput(Node_Debouncer::OUT_OUTPUT); }
		inline hlim::SignalRef filterState() const { return m_node->getInternal(Node_Debouncer::INT_FILTER_STATE); }
		inline const DebounceFilter &filter() const { return m_node->getFilter(); }
		inline OutputMode mode() const { return m_node->getOutputMode(); }
	private:
		Node_Debouncer *m_node = nullptr;
	};
}
