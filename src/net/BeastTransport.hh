/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/7/20.
//

#pragma once

#include "HTTPConnection.hh"
#include "URL.hh"

#include "fetch/Transport.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <deque>
#include <set>

namespace mf {

class BeastMultiplexer;

/// \brief  Sends GET requests with Boost.Beast.
///
/// The handle keeps its connection open after a request, and reuses it if the
/// next target has the same scheme, host and port.
class BeastHandle : public TransportHandle
{
public:
	explicit BeastHandle(BeastMultiplexer& parent);
	~BeastHandle() override;

	void configure(const Target& target) override;
	const Target& target() const override {return m_target;}
	Response content() override;

	const URL& url() const {return m_url;}
	std::error_code url_error() const {return m_url_error;}

	// number of connections opened by this handle
	std::size_t connections() const {return m_connections;}

	void start(std::function<void(std::error_code)>&& comp);
	void cancel();
	void fail(std::error_code ec);

private:
	void send();
	void on_response(std::error_code ec, HTTPConnection::Response&& res);
	HTTPConnection::Request make_request() const;

private:
	BeastMultiplexer& m_parent;

	Target          m_target;
	URL             m_url;
	std::error_code m_url_error;

	std::shared_ptr<HTTPConnection> m_conn;
	std::size_t                     m_connections{0};

	Response m_response;
	std::function<void(std::error_code)> m_comp;
};

/// \brief  Multiplexes Beast handles over a boost::asio::io_context.
///
/// The io_context is only run inside perform() and wait(), so all handlers are
/// invoked in the thread that drives the Dispatcher.
class BeastMultiplexer : public Multiplexer
{
public:
	BeastMultiplexer(boost::asio::io_context& ioc, ssl::context& ctx, TransportOptions opt = {});

	std::unique_ptr<TransportHandle> create_handle() override;
	void add(TransportHandle& handle) override;
	void remove(TransportHandle& handle) override;
	Status perform(std::size_t& running) override;
	std::optional<Completion> info_read() override;
	int wait(std::chrono::microseconds timeout) override;
	std::error_code last_error() const override {return m_error;}

	boost::asio::io_context& io_context() {return m_ioc;}
	ssl::context& ssl_context() {return m_ssl;}
	const TransportOptions& options() const {return m_opt;}

private:
	BeastHandle& cast(TransportHandle& handle) const;

private:
	boost::asio::io_context&    m_ioc;
	ssl::context&               m_ssl;
	TransportOptions            m_opt;

	std::set<BeastHandle*>      m_running;
	std::deque<Completion>      m_messages;
	std::error_code             m_error;
};

} // end of namespace mf
