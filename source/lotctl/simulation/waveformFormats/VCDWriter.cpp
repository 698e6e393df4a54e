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
#include "VCDWriter.h"
#include "../../utils/Preprocessor.h"
#include "../../utils/Exceptions.h"

#include <boost/format.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>

namespace lotctl::sim {

VCDWriter::VCDWriter(const std::filesystem::path &filename)
{
	if (filename.has_parent_path())
		std::filesystem::create_directories(filename.parent_path());

	m_file.open(filename, std::ofstream::binary);
	LOTCTL_DESIGNCHECK_HINT(m_file.is_open(), "Could not open " + filename.string() + " for writing.");

	std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::tm local;
	localtime_r(&now, &local);

	m_file << "$date\n" << std::put_time(&local, "%Y-%m-%d %X") << "\n$end\n";
	m_file << "$version\nLotctl simulation output\n$end\n";
	m_file << "$timescale\n1ps\n$end\n";
}

void VCDWriter::checkDeclarationPhase() const
{
	LOTCTL_ASSERT_HINT(!m_definitionsClosed, "Declarations must precede all value changes.");
}

void VCDWriter::checkValuePhase() const
{
	LOTCTL_ASSERT_HINT(m_definitionsClosed, "Value changes require beginDumpVars() first.");
}

VCDWriter::Section VCDWriter::beginModule(std::string_view name)
{
	LOTCTL_ASSERT(!name.empty());
	checkDeclarationPhase();
	m_file << "$scope module " << name << " $end\n";
	return Section(m_file, "$upscope $end\n");
}

void VCDWriter::declareWire(size_t width, std::string_view code, std::string_view label)
{
	checkDeclarationPhase();
	m_file << boost::format("$var wire %d %s %s $end\n") % width % code % label;
}

void VCDWriter::declareString(std::string_view code, std::string_view label)
{
	checkDeclarationPhase();
	m_file << boost::format("$var string 0 %s %s $end\n") % code % label;
}

VCDWriter::Section VCDWriter::beginDumpVars()
{
	checkDeclarationPhase();
	m_file << "$enddefinitions $end\n$dumpvars\n";
	m_definitionsClosed = true;
	return Section(m_file, "$end\n");
}

void VCDWriter::writeState(std::string_view code, size_t width, std::uint64_t value)
{
	checkValuePhase();

	std::string bits(width, '0');
	for (size_t bit = 0; bit < width; bit++)
		if ((value >> bit) & 1)
			bits[width - 1 - bit] = '1';

	m_file << 'b' << bits << ' ' << code << '\n';
}

void VCDWriter::writeBitState(std::string_view code, bool value)
{
	checkValuePhase();
	m_file << (value ? '1' : '0') << code << '\n';
}

// Strings may not contain whitespace, spaces are escaped the way gtkwave reads them back.
void VCDWriter::writeString(std::string_view code, std::string_view text)
{
	checkValuePhase();

	m_file << 's';
	if (text.empty())
		m_file << "\\x20";
	for (char c : text) {
		if (c == ' ')
			m_file << "\\x20";
		else if (c == '\n')
			m_file << "\\x0a";
		else
			m_file << c;
	}
	m_file << ' ' << code << '\n';
}

void VCDWriter::writeTime(std::uint64_t picoseconds)
{
	checkValuePhase();
	m_file << '#' << picoseconds << '\n';
}

}
