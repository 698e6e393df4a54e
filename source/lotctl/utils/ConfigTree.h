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

#include "Exceptions.h"

#include <yaml-cpp/yaml.h>
#include <magic_enum.hpp>

#include <boost/lexical_cast.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <filesystem>
#include <sstream>
#include <vector>

namespace lotctl::utils
{
	/// Expands $(NAME) references to environment variables.
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view into a stack of yaml documents.
	 * @details Documents loaded later take precedence over documents loaded earlier. Paths
	 * are separated by '/' and are resolved through nested maps.
	 */
	class YamlConfigTree
	{
	public:
		struct iterator {
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			YamlConfigTree operator*() { return YamlConfigTree(*it); }
			bool operator==(const iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const iterator& rhs) const { return it != rhs.it; }
		};

	public:
		YamlConfigTree() = default;
		YamlConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isScalar() const;
		bool isSequence() const;

		iterator begin() const;
		iterator end() const;
		size_t size() const;
		YamlConfigTree operator[](size_t index) const;

		YamlConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &document);

	protected:
		std::vector<YAML::Node> m_nodes;
	};

	template<typename T>
	inline T YamlConfigTree::as(const T& def) const
	{
		if (!isDefined())
			return def;
		return as<T>();
	}

	template<typename T>
	inline T YamlConfigTree::as() const
	{
		if (!isDefined())
			throw std::runtime_error{ "non optional config value not found" };

		const YAML::Node &node = m_nodes.front();
		try {
			return node.as<T>();
		} catch (const YAML::BadConversion &) {
			if (!node.IsScalar())
				throw;
			auto str = node.as<std::string>();
			if (str.empty() || str[0] != '$')
				throw;
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "false" || str == "No")
					return false;
				if (str == "true" || str == "Yes")
					return true;
				throw;
			} else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
				return boost::lexical_cast<T>(str);
			else
				throw;
		}
	}

	template<>
	inline std::string YamlConfigTree::as(const std::string& def) const
	{
		if (!isDefined())
			return replaceEnvVars(def);
		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	template<>
	inline std::string YamlConfigTree::as() const
	{
		if (!isDefined())
			throw std::runtime_error{ "non optional config value not found" };
		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	using ConfigTree = YamlConfigTree;
}

namespace YAML
{
	template<typename T>
	struct convert
	{
		static auto encode(T value) -> std::enable_if_t<std::is_enum_v<T>, Node>
		{
			return Node{ std::string{ magic_enum::enum_name(value) } };
		}

		static auto decode(const Node& node, T& out) -> std::enable_if_t<std::is_enum_v<T>, bool>
		{
			const std::string value = node.as<std::string>();
			const std::optional<T> eval = magic_enum::enum_cast<T>(value,
				[](char a, char b) { return std::tolower(a) == std::tolower(b); });

			if (eval)
			{
				out = *eval;
				return true;
			}

			std::ostringstream err;
			err << "unknown value '" << value << "' for enum " << magic_enum::enum_type_name<T>()
				<< ". Valid values are ";

			auto names = magic_enum::enum_names<T>();
			for (size_t i = 0; i < names.size(); ++i)
			{
				if (i == names.size() - 1 && names.size() > 1)
					err << " or ";
				else if (i != 0)
					err << ", ";
				err << names[i];
			}
			throw std::runtime_error(err.str());
		}
	};
}
