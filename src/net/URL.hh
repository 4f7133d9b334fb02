/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace mf {

// An absolute http:// or https:// URL, i.e. https://host:port/path?query
class URL
{
public:
	URL() = default;
	URL(std::string_view url, std::error_code& ec);

	const std::string& scheme() const {return m_scheme;}
	const std::string& host() const {return m_host;}
	const std::string& port() const {return m_port;}

	// path and query, to be used as the request target
	const std::string& target() const {return m_target;}

	bool secure() const {return m_scheme == "https";}
	bool default_port() const;

	// value of the Host header field
	std::string host_field() const;

	// scheme://host:port, the part that identifies a connection
	std::string origin() const;

	bool same_origin(const URL& other) const;

private:
	std::string m_scheme;
	std::string m_host;
	std::string m_port;
	std::string m_target{"/"};
	bool m_ipv6{false};
};

} // end of namespace mf
