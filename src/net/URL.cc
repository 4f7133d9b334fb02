/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#include "URL.hh"

#include "util/Error.hh"

#include <algorithm>
#include <cctype>

namespace mf {
namespace {

bool valid_port(std::string_view port)
{
	if (port.empty() || port.size() > 5 || !std::all_of(port.begin(), port.end(), [](char c){return std::isdigit(static_cast<unsigned char>(c));}))
		return false;

	auto value = std::stoul(std::string{port});
	return value > 0 && value <= 65535;
}

} // end of local namespace

URL::URL(std::string_view url, std::error_code& ec)
{
	// no spaces or control characters anywhere
	if (url.empty() || std::any_of(url.begin(), url.end(), [](char c)
	{
		auto uc = static_cast<unsigned char>(c);
		return uc <= 0x20 || uc == 0x7f;
	}))
	{
		ec = Error::malformed_url;
		return;
	}

	auto scheme_end = url.find("://");
	if (scheme_end == url.npos || scheme_end == 0)
	{
		ec = Error::malformed_url;
		return;
	}

	m_scheme = url.substr(0, scheme_end);
	std::transform(m_scheme.begin(), m_scheme.end(), m_scheme.begin(), [](char c){return std::tolower(static_cast<unsigned char>(c));});
	if (m_scheme != "http" && m_scheme != "https")
	{
		ec = Error::unsupported_scheme;
		return;
	}
	url.remove_prefix(scheme_end + 3);

	auto authority = url.substr(0, url.find_first_of("/?#"));
	url.remove_prefix(authority.size());

	// drop user:password@
	if (auto at = authority.find_last_of('@'); at != authority.npos)
		authority.remove_prefix(at + 1);

	std::string_view port;
	if (!authority.empty() && authority.front() == '[')
	{
		auto close = authority.find(']');
		if (close == authority.npos)
		{
			ec = Error::malformed_url;
			return;
		}
		m_host  = authority.substr(1, close - 1);
		m_ipv6  = true;

		authority.remove_prefix(close + 1);
		if (!authority.empty())
		{
			if (authority.front() != ':')
			{
				ec = Error::malformed_url;
				return;
			}
			port = authority.substr(1);
		}
	}
	else
	{
		auto colon = authority.find_last_of(':');
		m_host = authority.substr(0, colon);
		if (colon != authority.npos)
			port = authority.substr(colon + 1);
	}

	if (m_host.empty() || (!port.empty() && !valid_port(port)) || (port.empty() && authority.find(':') != authority.npos))
	{
		ec = Error::malformed_url;
		return;
	}
	m_port = port.empty() ? (secure() ? "443" : "80") : std::string{port};

	// the fragment is not sent to the server
	url = url.substr(0, url.find('#'));
	if (url.empty() || url.front() != '/')
		m_target = "/" + std::string{url};
	else
		m_target = url;

	ec.clear();
}

bool URL::default_port() const
{
	return m_port == (secure() ? "443" : "80");
}

std::string URL::host_field() const
{
	auto host = m_ipv6 ? "[" + m_host + "]" : m_host;
	return default_port() ? host : host + ":" + m_port;
}

std::string URL::origin() const
{
	return m_scheme + "://" + host_field();
}

bool URL::same_origin(const URL& other) const
{
	return m_scheme == other.m_scheme && m_host == other.m_host && m_port == other.m_port;
}

} // end of namespace mf
