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

#include "URL.hh"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace mf {

using tcp = boost::asio::ip::tcp;       // from <boost/asio/ip/tcp.hpp>
namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>
namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

struct TransportOptions
{
	// for each resolve, connect, handshake, write and read
	std::chrono::seconds timeout{30};

	std::string     user_agent;
	bool            include_header{false};
	bool            fail_on_http_error{false};
	std::uint64_t   body_limit{8 * 1024 * 1024};
	bool            insecure{false};
};

/// \brief  One TCP or TLS connection to an origin server.
///
/// The connection is opened by the first request and kept open for the
/// following requests to the same origin as long as the server allows. Once
/// closed, it cannot be reopened.
class HTTPConnection : public std::enable_shared_from_this<HTTPConnection>
{
public:
	using Request   = http::request<http::empty_body>;
	using Response  = http::response<http::string_body>;
	using Complete  = std::function<void(std::error_code, Response&&)>;

public:
	HTTPConnection(boost::asio::io_context& ioc, ssl::context& ctx, const URL& origin, const TransportOptions& opt);
	HTTPConnection(const HTTPConnection&) = delete;
	HTTPConnection& operator=(const HTTPConnection&) = delete;

	void request(Request&& req, Complete&& comp);

	// Cancels the outstanding request without calling its completion callback.
	void close();

	bool connected() const {return m_connected;}
	bool busy() const {return static_cast<bool>(m_comp);}
	bool reusable_for(const URL& url) const;

	// True if the last request failed because the server closed the kept-alive
	// connection before responding. The request can be sent again on a new
	// connection.
	bool dropped() const {return m_dropped;}

	std::size_t served() const {return m_served;}

private:
	boost::beast::tcp_stream& lowest_layer();

	void on_resolve_timeout(boost::system::error_code ec);
	void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
	void on_connect(boost::system::error_code ec);
	void on_handshake(boost::system::error_code ec);
	void send();
	void on_write(boost::system::error_code ec, std::size_t bytes);
	void on_header(boost::system::error_code ec, std::size_t bytes);
	void on_read(boost::system::error_code ec, std::size_t bytes);
	void finish(boost::system::error_code ec, Response&& res = {});

	template <typename Func>
	void with_stream(Func&& func)
	{
		if (m_tls)
			func(*m_tls);
		else
			func(*m_tcp);
	}

private:
	tcp::resolver   m_resolver;

	// tcp_stream has no deadline for resolving
	boost::asio::steady_timer   m_resolve_timer;
	bool                        m_resolving{false};

	// one of them is used, depending on the scheme of the origin
	std::optional<boost::beast::tcp_stream>                 m_tcp;
	std::optional<ssl::stream<boost::beast::tcp_stream>>    m_tls;

	URL                 m_origin;
	TransportOptions    m_opt;

	boost::beast::flat_buffer m_buffer; // (Must persist between reads)
	Request m_req;
	std::optional<http::response_parser<http::string_body>> m_parser;

	Complete    m_comp;
	std::size_t m_served{0};
	bool        m_dropped{false};
	bool        m_connected{false};
	bool        m_closed{false};
	bool        m_keep_alive{true};
};

} // end of namespace mf
