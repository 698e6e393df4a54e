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

#include <concepts>
#include <cstddef>
#include <iterator>

namespace lotctl::utils {

	/// Half open interval [begin, end) of integers for use in range based for loops.
	template<std::integral T = size_t>
	class Range
	{
		public:
			class iterator {
				public:
					using iterator_category = std::forward_iterator_tag;
					using value_type = T;
					using difference_type = std::ptrdiff_t;

					iterator() = default;
					explicit iterator(T value) : m_value(value) { }

					T operator*() const { return m_value; }
					iterator &operator++() { ++m_value; return *this; }
					iterator operator++(int) { iterator prev = *this; ++m_value; return prev; }
					bool operator==(const iterator &rhs) const = default;
				protected:
					T m_value = 0;
			};

			Range(T begin, T end) : m_begin(begin), m_end(end < begin ? begin : end) { }
			Range(T end) : Range(T(0), end) { }

			iterator begin() const { return iterator(m_begin); }
			iterator end() const { return iterator(m_end); }

			size_t size() const { return size_t(m_end - m_begin); }
			bool empty() const { return m_begin == m_end; }
		protected:
			T m_begin;
			T m_end;
	};

}
