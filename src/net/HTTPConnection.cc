/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#include "HTTPConnection.hh"

#include "util/Log.hh"

#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mf {

HTTPConnection::HTTPConnection(
	boost::asio::io_context& ioc,
	ssl::context& ctx,
	const URL& origin,
	const TransportOptions& opt
) :
	m_resolver{ioc}, m_resolve_timer{ioc}, m_origin{origin}, m_opt{opt}
{
	if (m_origin.secure())
		m_tls.emplace(ioc, ctx);
	else
		m_tcp.emplace(ioc);
}

boost::beast::tcp_stream& HTTPConnection::lowest_layer()
{
	return m_tls ? m_tls->next_layer() : *m_tcp;
}

bool HTTPConnection::reusable_for(const URL& url) const
{
	return m_connected && !m_closed && m_keep_alive && !busy() && m_origin.same_origin(url);
}

void HTTPConnection::request(Request&& req, Complete&& comp)
{
	m_req  = std::move(req);
	m_comp = std::move(comp);
	m_dropped = false;

	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();
	m_parser->body_limit(m_opt.body_limit);

	if (m_connected)
		return send();

	if (m_tls)
	{
		// Set SNI Hostname (many hosts need this to handshake successfully)
		if (!SSL_set_tlsext_host_name(m_tls->native_handle(), m_origin.host().c_str()))
		{
			boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
			return finish(ec);
		}

		if (m_opt.insecure)
			m_tls->set_verify_mode(ssl::verify_none);
		else
		{
			m_tls->set_verify_mode(ssl::verify_peer);
			m_tls->set_verify_callback(ssl::host_name_verification{m_origin.host()});
		}
	}

	m_resolving = true;
	m_resolve_timer.expires_after(m_opt.timeout);
	m_resolve_timer.async_wait([self=shared_from_this()](auto ec){self->on_resolve_timeout(ec);});

	// Look up the domain name
	m_resolver.async_resolve(
		m_origin.host(),
		m_origin.port(),
		[self=shared_from_this()](auto ec, auto results){self->on_resolve(ec, std::move(results));}
	);
}

void HTTPConnection::on_resolve_timeout(boost::system::error_code ec)
{
	if (ec || m_closed || !m_resolving)
		return;

	Log(LOG_INFO, "timeout resolving %1%", m_origin.host());
	m_resolving = false;
	finish(boost::beast::error::timeout);
}

void HTTPConnection::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results)
{
	if (m_closed)
		return;

	m_resolving = false;
	m_resolve_timer.cancel();
	if (ec)
		return finish(ec);

	// Make the connection on the IP address we get from a lookup
	lowest_layer().expires_after(m_opt.timeout);
	lowest_layer().async_connect(
		results,
		[self=shared_from_this()](auto ec, auto&&){self->on_connect(ec);}
	);
}

void HTTPConnection::on_connect(boost::system::error_code ec)
{
	if (m_closed)
		return;
	if (ec)
		return finish(ec);

	if (!m_tls)
	{
		m_connected = true;
		return send();
	}

	// Perform the SSL handshake
	lowest_layer().expires_after(m_opt.timeout);
	m_tls->async_handshake(
		ssl::stream_base::client,
		[self=shared_from_this()](auto ec){self->on_handshake(ec);}
	);
}

void HTTPConnection::on_handshake(boost::system::error_code ec)
{
	if (m_closed)
		return;
	if (ec)
		return finish(ec);

	m_connected = true;
	send();
}

void HTTPConnection::send()
{
	// Send the HTTP request to the remote host
	lowest_layer().expires_after(m_opt.timeout);
	with_stream([this](auto& stream)
	{
		http::async_write(
			stream, m_req,
			[self=shared_from_this()](auto ec, auto bytes){self->on_write(ec, bytes);}
		);
	});
}

void HTTPConnection::on_write(boost::system::error_code ec, std::size_t)
{
	if (m_closed)
		return;
	if (ec)
		return finish(ec);

	// Receive the HTTP response header first to check the size of the body
	lowest_layer().expires_after(m_opt.timeout);
	with_stream([this](auto& stream)
	{
		http::async_read_header(
			stream, m_buffer, *m_parser,
			[self=shared_from_this()](auto ec, auto bytes){self->on_header(ec, bytes);}
		);
	});
}

void HTTPConnection::on_header(boost::system::error_code ec, std::size_t)
{
	if (m_closed)
		return;
	if (ec)
		return finish(ec);

	auto length = m_parser->content_length();
	if (length && *length > m_opt.body_limit)
		return finish(http::error::body_limit);

	lowest_layer().expires_after(m_opt.timeout);
	with_stream([this](auto& stream)
	{
		http::async_read(
			stream, m_buffer, *m_parser,
			[self=shared_from_this()](auto ec, auto bytes){self->on_read(ec, bytes);}
		);
	});
}

void HTTPConnection::on_read(boost::system::error_code ec, std::size_t)
{
	if (m_closed)
		return;
	if (ec)
		return finish(ec);

	// chunked or unknown length
	if (m_parser->get().body().size() > m_opt.body_limit)
		return finish(http::error::body_limit);

	lowest_layer().expires_never();
	m_keep_alive = m_parser->get().keep_alive();
	finish(ec, m_parser->release());
}

void HTTPConnection::finish(boost::system::error_code ec, Response&& res)
{
	m_dropped = ec && m_served > 0 && (
		ec == http::error::end_of_stream ||
		ec == boost::asio::error::eof ||
		ec == boost::asio::error::connection_reset ||
		ec == boost::asio::error::broken_pipe
	);
	if (!ec)
		m_served++;

	auto comp = std::move(m_comp);
	m_comp = nullptr;

	if (ec || !m_keep_alive)
		close();

	if (comp)
		comp(ec, std::move(res));
}

void HTTPConnection::close()
{
	if (m_connected)
		Log(LOG_DEBUG, "closing connection to %1% after %2% requests", m_origin.origin(), m_served);

	m_comp = nullptr;
	m_closed = true;
	m_connected = false;

	m_resolving = false;
	m_resolver.cancel();
	m_resolve_timer.cancel();
	lowest_layer().close();
}

} // end of namespace mf
