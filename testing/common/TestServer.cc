/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/10/20.
//

#include "TestServer.hh"

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>

namespace mf::test {

using tcp = boost::asio::ip::tcp;
namespace http = boost::beast::http;

class TestServer::Session : public std::enable_shared_from_this<Session>
{
public:
	Session(tcp::socket socket, TestServer& parent) :
		m_socket{std::move(socket)}, m_timer{m_socket.get_executor()}, m_parent{parent}
	{
	}

	void run() {do_read();}

private:
	void do_read()
	{
		m_req = {};
		http::async_read(m_socket, m_buffer, m_req, [self=shared_from_this()](auto ec, auto)
		{
			if (!ec)
				self->on_read();
		});
	}

	void on_read()
	{
		m_parent.m_requests++;

		std::string target{m_req.target()};
		m_res = {};
		m_res.version(m_req.version());
		m_res.result(http::status::ok);
		m_res.set(http::field::content_type, "text/plain");
		m_res.body() = "hello " + target;

		using namespace std::literals;
		if (target.rfind("/status/"sv, 0) == 0)
		{
			m_res.result(std::stoi(target.substr(8)));
			m_res.body() = "status " + target.substr(8);
		}
		else if (target == "/big")
			m_res.body().assign(1024 * 1024, 'x');

		m_res.keep_alive(m_parent.m_mode == KeepAlive::refuse ? false : m_req.keep_alive());
		m_res.prepare_payload();

		if (target.rfind("/delay/"sv, 0) == 0)
		{
			m_timer.expires_after(std::chrono::milliseconds{std::stoi(target.substr(7))});
			m_timer.async_wait([self=shared_from_this()](auto ec)
			{
				if (!ec)
					self->do_write();
			});
		}
		else
			do_write();
	}

	void do_write()
	{
		http::async_write(m_socket, m_res, [self=shared_from_this()](auto ec, auto)
		{
			if (!ec)
				self->on_write();
		});
	}

	void on_write()
	{
		if (m_res.keep_alive() && m_parent.m_mode == KeepAlive::normal)
			return do_read();

		boost::system::error_code ec;
		m_socket.shutdown(tcp::socket::shutdown_both, ec);
		m_socket.close(ec);
	}

private:
	tcp::socket                 m_socket;
	boost::asio::steady_timer   m_timer;
	TestServer&                 m_parent;

	boost::beast::flat_buffer           m_buffer;
	http::request<http::string_body>    m_req;
	http::response<http::string_body>   m_res;
};

TestServer::TestServer(KeepAlive mode) :
	m_acceptor{m_ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}},
	m_mode{mode},
	m_port{m_acceptor.local_endpoint().port()}
{
	do_accept();
	m_thread = std::thread{[this]{m_ioc.run();}};
}

TestServer::~TestServer()
{
	m_ioc.stop();
	m_thread.join();
}

std::string TestServer::url(std::string_view target) const
{
	return "http://127.0.0.1:" + std::to_string(port()) + std::string{target};
}

void TestServer::do_accept()
{
	m_acceptor.async_accept([this](auto ec, tcp::socket socket)
	{
		if (ec)
			return;

		m_connections++;
		std::make_shared<Session>(std::move(socket), *this)->run();
		do_accept();
	});
}

std::uint16_t TestServer::closed_port()
{
	boost::asio::io_context ioc;
	tcp::acceptor acceptor{ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
	return acceptor.local_endpoint().port();
}

} // end of namespace mf::test
