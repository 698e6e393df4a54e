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
#include <lotctl/frontend.h>
#include <lotctl/scl/ParkingLot.h>
#include <lotctl/scl/DisplayObserver.h>
#include <lotctl/simulation/ReferenceSimulator.h>
#include <lotctl/simulation/waveformFormats/VCDSink.h>
#include <lotctl/utils/ConfigTree.h>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lotctl;

namespace {

	struct Options {
		std::string configFile;
		std::string stimulusFile;
		std::string vcdFile;
		size_t cycles = 1'000;
		bool trace = false;
		bool traceClocks = false;
	};

	struct StimulusEvent {
		size_t cycle;
		std::string signal;
		std::uint64_t value;
	};

	void printUsage(const char *program)
	{
		std::cout << "Usage: " << program << " [--config <file.yaml>] [--stimulus <file.yaml>] [--vcd <file.vcd>] [--cycles <n>] [--trace] [--trace-clocks]" << std::endl
			<< "  --config        parking lot configuration (parking_lot section)" << std::endl
			<< "  --stimulus      input events, a list 'events' of {cycle, signal, value}" << std::endl
			<< "  --vcd           write a waveform of all pins and registers" << std::endl
			<< "  --cycles        number of system clock cycles to simulate (default 1000)" << std::endl
			<< "  --trace         print simulator events" << std::endl
			<< "  --trace-clocks  also print every clock edge" << std::endl;
	}

	Options parseArguments(int argc, char *argv[])
	{
		Options options;
		for (int i = 1; i < argc; i++) {
			std::string arg = argv[i];
			auto value = [&]() -> std::string {
				LOTCTL_DESIGNCHECK_HINT(i + 1 < argc, "Missing value for " + arg);
				return argv[++i];
			};

			if (arg == "--config")
				options.configFile = value();
			else if (arg == "--stimulus")
				options.stimulusFile = value();
			else if (arg == "--vcd")
				options.vcdFile = value();
			else if (arg == "--cycles")
				options.cycles = boost::lexical_cast<size_t>(value());
			else if (arg == "--trace")
				options.trace = true;
			else if (arg == "--trace-clocks")
				options.trace = options.traceClocks = true;
			else
				LOTCTL_DESIGNCHECK_HINT(false, "Unknown argument " + arg);
		}
		return options;
	}

	std::vector<StimulusEvent> loadStimulus(const std::string &filename)
	{
		utils::ConfigTree stimulus;
		stimulus.loadFromFile(filename);

		std::vector<StimulusEvent> events;
		auto list = stimulus["events"];
		if (!list)
			return events;

		LOTCTL_DESIGNCHECK_HINT(list.isSequence(), "The events of a stimulus must be a list.");
		for (auto entry : list) {
			try {
				events.push_back(StimulusEvent{
					.cycle = entry["cycle"].as<size_t>(),
					.signal = entry["signal"].as<std::string>(),
					.value = entry["value"].as<std::uint64_t>(),
				});
			} catch (const std::exception &e) {
				throw utils::DesignError(__FILE__, __LINE__, std::string("Invalid stimulus event in ") + filename + ": " + e.what());
			}
		}

		std::stable_sort(events.begin(), events.end(), [](const StimulusEvent &lhs, const StimulusEvent &rhs) {
			return lhs.cycle < rhs.cycle;
		});
		return events;
	}

	int run(const Options &options)
	{
		scl::ParkingLotConfig config;
		if (!options.configFile.empty()) {
			utils::ConfigTree configTree;
			configTree.loadFromFile(options.configFile);
			config.load(configTree);
		}

		DesignScope design;
		scl::ParkingLot lot(config);
		hlim::Circuit &circuit = design.getCircuit();

		std::vector<StimulusEvent> events;
		if (!options.stimulusFile.empty())
			events = loadStimulus(options.stimulusFile);

		std::vector<hlim::SignalRef> eventSignals;
		for (const auto &event : events) {
			auto signal = circuit.findSignal(event.signal);
			LOTCTL_DESIGNCHECK_HINT(signal, "The stimulus drives the unknown signal " + event.signal);
			LOTCTL_DESIGNCHECK_HINT(circuit.getSignal(*signal).kind == hlim::SignalKind::PIN_IN, "The stimulus drives " + event.signal + " which is not an input pin.");
			eventSignals.push_back(*signal);
		}

		sim::ReferenceSimulator simulator;
		sim::SimulatorConsoleOutput consoleOutput;
		consoleOutput.printClocks(options.traceClocks);
		if (options.trace)
			simulator.addCallbacks(&consoleOutput);

		std::unique_ptr<sim::VCDSink> vcd;
		if (!options.vcdFile.empty()) {
			vcd = std::make_unique<sim::VCDSink>(circuit, simulator, options.vcdFile.c_str());
			vcd->addAllPins();
			vcd->addAllNamedSignals();
			vcd->addAllSignals();
			vcd->recordMessages(options.trace, true, true);
		}

		scl::DisplayObserver display(simulator, lot.digitSelect(), lot.segments());

		simulator.compileProgram(circuit);
		simulator.powerOn();

		const hlim::Clock *clock = lot.systemClock().getClk();
		for (size_t i = 0; i < events.size(); i++) {
			const auto &event = events[i];
			if (event.cycle > options.cycles)
				break;

			size_t elapsed = simulator.getClockCycles(clock);
			if (event.cycle > elapsed)
				simulator.advanceCycles(clock, event.cycle - elapsed);

			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
				<< "Cycle " << event.cycle << ": " << event.signal << " = " << (size_t) event.value);
			simulator.setInputPin(eventSignals[i], event.value);
		}

		size_t elapsed = simulator.getClockCycles(clock);
		if (options.cycles > elapsed)
			simulator.advanceCycles(clock, options.cycles - elapsed);
		simulator.commitState();

		std::cout << "cycles:      " << simulator.getClockCycles(clock) << std::endl;
		std::cout << "time:        ";
		hlim::formatTime(std::cout, simulator.getCurrentSimulationTime());
		std::cout << std::endl;
		std::cout << "count:       " << simulator.getValueOfSignal(lot.count()) << " / " << config.capacity << std::endl;
		std::cout << "open_flag:   " << simulator.getValueOfSignal(lot.openFlag()) << std::endl;
		std::cout << "full_flag:   " << simulator.getValueOfSignal(lot.fullFlag()) << std::endl;
		std::cout << "closed_flag: " << simulator.getValueOfSignal(lot.closedFlag()) << std::endl;
		std::cout << "display:     [" << display.text() << ']' << std::endl;
		return 0;
	}
}

int main(int argc, char *argv[])
{
	dbg::logConsole(dbg::LogMessage::LOG_INFO);

	try {
		for (int i = 1; i < argc; i++)
			if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
				printUsage(argv[0]);
				return 0;
			}

		return run(parseArguments(argc, argv));
	} catch (const utils::DesignError &e) {
		std::cerr << "Design error: " << e.what() << std::endl;
	} catch (const utils::InternalError &e) {
		std::cerr << "Internal error: " << e.what() << std::endl;
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << std::endl;
	}
	return 1;
}
