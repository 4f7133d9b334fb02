/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/10/20.
//

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace mf::test {

/// \brief  A plain HTTP server running in its own thread on 127.0.0.1.
///
/// Supported targets:
///   /delay/<ms>/...   respond after <ms> milliseconds
///   /status/<code>    respond with the status code
///   /big              respond with a 1MB body
///   anything else     respond "hello <target>"
class TestServer
{
public:
	enum class KeepAlive
	{
		normal,     // follow the request
		refuse,     // respond with "Connection: close" and close
		drop        // close after responding without telling the client
	};

public:
	explicit TestServer(KeepAlive mode = KeepAlive::normal);
	~TestServer();

	TestServer(const TestServer&) = delete;
	TestServer& operator=(const TestServer&) = delete;

	std::uint16_t port() const {return m_port;}
	std::string url(std::string_view target) const;

	std::size_t connections() const {return m_connections;}
	std::size_t requests() const {return m_requests;}

	// a port that nobody listens to
	static std::uint16_t closed_port();

private:
	class Session;

	void do_accept();

private:
	boost::asio::io_context         m_ioc;
	boost::asio::ip::tcp::acceptor  m_acceptor;
	KeepAlive                       m_mode;
	std::uint16_t                   m_port{};

	std::atomic<std::size_t>    m_connections{0};
	std::atomic<std::size_t>    m_requests{0};

	std::thread m_thread;
};

} // end of namespace mf::test
