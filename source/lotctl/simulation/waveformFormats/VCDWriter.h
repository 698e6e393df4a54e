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

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace lotctl::sim
{
	/**
	 * @brief Low level writer for value change dump files.
	 * @details Declarations (modules, wires, strings) must all be written before the first
	 * value change. Time stamps are in picoseconds.
	 */
	class VCDWriter
	{
	public:
		/// Closes a $scope or $dumpvars section when it goes out of scope.
		class Section
		{
		public:
			Section(std::ofstream &file, const char *closing) : m_file(&file), m_closing(closing) { }
			Section(Section &&other) noexcept : m_file(other.m_file), m_closing(other.m_closing) { other.m_file = nullptr; }
			Section(const Section&) = delete;
			~Section() { if (m_file) *m_file << m_closing; }
		private:
			std::ofstream *m_file;
			const char *m_closing;
		};

		VCDWriter(const std::filesystem::path &filename);

		explicit operator bool () const { return (bool)m_file; }
		void flush() { m_file.flush(); }

		Section beginModule(std::string_view name);
		void declareWire(size_t width, std::string_view code, std::string_view label);
		void declareString(std::string_view code, std::string_view label);

		Section beginDumpVars();
		void writeState(std::string_view code, size_t width, std::uint64_t value);
		void writeBitState(std::string_view code, bool value);
		void writeString(std::string_view code, std::string_view text);
		void writeTime(std::uint64_t picoseconds);

	protected:
		std::ofstream m_file;
		bool m_definitionsClosed = false;

		void checkDeclarationPhase() const;
		void checkValuePhase() const;
	};
}
