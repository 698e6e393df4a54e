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
#include "ConfigTree.h"

#include <boost/spirit/home/x3.hpp>

#include <cstdlib>

namespace lotctl::utils
{
	std::string replaceEnvVars(const std::string& src)
	{
		using namespace boost::spirit::x3;

		std::string ret;
		ret.reserve(src.size());

		auto append_var = [&](auto& ctx) {
			const char* var_name = _attr(ctx).c_str();
			const char* var = std::getenv(var_name);
			if (!var)
				throw std::runtime_error(std::string("environment variable '") + var_name + "' not found.");
			_attr(ctx) = var;
		};

		auto parser = *((lit('$') >> '(' >> (*(char_ - ')'))[append_var] >> ')') | char_);
		bool valid = parse(src.cbegin(), src.cend(), parser, ret);
		LOTCTL_ASSERT(valid);
		return ret;
	}

	namespace {
		std::optional<YAML::Node> resolvePath(const YAML::Node &root, std::string_view path)
		{
			YAML::Node current(root);
			while (!path.empty())
			{
				size_t sep = path.find('/');
				std::string key{ path.substr(0, sep) };
				path = sep == std::string_view::npos ? std::string_view{} : path.substr(sep + 1);

				if (key.empty())
					continue;
				if (!current.IsMap())
					return std::nullopt;

				const YAML::Node &constCurrent = current;
				YAML::Node child = constCurrent[key];
				if (!child.IsDefined())
					return std::nullopt;
				current.reset(child);
			}
			return current;
		}
	}

	YamlConfigTree::YamlConfigTree(YAML::Node node) :
		m_nodes{node}
	{
	}

	YamlConfigTree YamlConfigTree::operator[](std::string_view path) const
	{
		YamlConfigTree ret;
		for (auto it = m_nodes.rbegin(); it != m_nodes.rend(); ++it)
		{
			auto element = resolvePath(*it, path);
			if (!element)
				continue;

			if (!element->IsMap()) {
				if (ret.m_nodes.empty())
					ret.m_nodes.push_back(*element);
				break;
			}
			// Maps of all layers stay visible so that partial overrides fall through to earlier documents.
			ret.m_nodes.insert(ret.m_nodes.begin(), *element);
		}
		return ret;
	}

	bool YamlConfigTree::isDefined() const
	{
		return !m_nodes.empty() && m_nodes.front().IsDefined();
	}

	bool YamlConfigTree::isScalar() const
	{
		return m_nodes.size() == 1 && m_nodes.front().IsScalar();
	}

	bool YamlConfigTree::isSequence() const
	{
		return m_nodes.size() == 1 && m_nodes.front().IsSequence();
	}

	YamlConfigTree::iterator YamlConfigTree::begin() const
	{
		if (isSequence())
			return iterator{ m_nodes.front().begin() };
		return iterator{};
	}

	YamlConfigTree::iterator YamlConfigTree::end() const
	{
		if (isSequence())
			return iterator{ m_nodes.front().end() };
		return iterator{};
	}

	size_t YamlConfigTree::size() const
	{
		if (isSequence())
			return m_nodes.front().size();
		return 0;
	}

	YamlConfigTree YamlConfigTree::operator[](size_t index) const
	{
		if (isSequence()) {
			const YAML::Node &seq = m_nodes.front();
			return YamlConfigTree{ seq[index] };
		}
		return YamlConfigTree();
	}

	void YamlConfigTree::loadFromFile(const std::filesystem::path &filename)
	{
		m_nodes.push_back(YAML::LoadFile(filename.string()));
		if (m_nodes.size() > 1 && !m_nodes.back().IsMap())
			throw std::runtime_error(filename.string() + " is not a yaml map");
	}

	void YamlConfigTree::loadFromString(const std::string &document)
	{
		m_nodes.push_back(YAML::Load(document));
		if (m_nodes.size() > 1 && !m_nodes.back().IsMap())
			throw std::runtime_error("yaml document is not a map");
	}
}
