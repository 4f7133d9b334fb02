/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/7/20.
//

#include "BeastTransport.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include "config.hh"

#include <algorithm>
#include <sstream>
#include <utility>

namespace mf {

BeastHandle::BeastHandle(BeastMultiplexer& parent) : m_parent{parent}
{
}

BeastHandle::~BeastHandle()
{
	if (m_conn)
		m_conn->close();
}

void BeastHandle::configure(const Target& target)
{
	m_target = target;
	m_url = URL{target.str(), m_url_error};
	m_response = Response{};
}

Response BeastHandle::content()
{
	return std::exchange(m_response, Response{});
}

HTTPConnection::Request BeastHandle::make_request() const
{
	auto& opt = m_parent.options();

	HTTPConnection::Request req{http::verb::get, m_url.target(), 11};
	req.set(http::field::host, m_url.host_field());
	req.set(http::field::user_agent, opt.user_agent.empty() ? std::string{constants::default_user_agent} : opt.user_agent);
	req.set(http::field::accept, "*/*");
	return req;
}

void BeastHandle::start(std::function<void(std::error_code)>&& comp)
{
	m_comp = std::move(comp);
	m_response = Response{};
	send();
}

void BeastHandle::send()
{
	// open a new connection if the current one cannot be used for this URL
	if (!m_conn || !m_conn->reusable_for(m_url))
	{
		if (m_conn)
			m_conn->close();

		m_conn = std::make_shared<HTTPConnection>(
			m_parent.io_context(), m_parent.ssl_context(), m_url, m_parent.options()
		);
		m_connections++;
	}

	m_conn->request(make_request(), [this](auto ec, auto&& res){on_response(ec, std::move(res));});
}

void BeastHandle::on_response(std::error_code ec, HTTPConnection::Response&& res)
{
	if (ec && m_conn->dropped())
	{
		Log(LOG_DEBUG, "connection to %1% was closed by server, reconnecting", m_url.origin());
		m_conn.reset();
		return send();
	}

	auto& opt = m_parent.options();
	if (!ec)
	{
		m_response.status = res.result_int();
		if (opt.include_header)
		{
			std::ostringstream ss;
			ss << res.base();
			m_response.header = ss.str();
		}
		m_response.body = std::move(res.body());

		if (opt.fail_on_http_error && m_response.status >= 400)
			ec = Error::http_status;
	}
	m_response.error = ec;

	auto comp = std::move(m_comp);
	m_comp = nullptr;
	if (comp)
		comp(ec);
}

void BeastHandle::cancel()
{
	m_comp = nullptr;
	m_response = Response{};
	m_response.error = Error::cancelled;

	// the connection is in the middle of a request and cannot be reused
	if (m_conn && m_conn->busy())
	{
		m_conn->close();
		m_conn.reset();
	}
}

void BeastHandle::fail(std::error_code ec)
{
	m_response = Response{};
	m_response.error = ec;
}

BeastMultiplexer::BeastMultiplexer(boost::asio::io_context& ioc, ssl::context& ctx, TransportOptions opt) :
	m_ioc{ioc}, m_ssl{ctx}, m_opt{std::move(opt)}
{
}

BeastHandle& BeastMultiplexer::cast(TransportHandle& handle) const
{
	return dynamic_cast<BeastHandle&>(handle);
}

std::unique_ptr<TransportHandle> BeastMultiplexer::create_handle()
{
	return std::make_unique<BeastHandle>(*this);
}

void BeastMultiplexer::add(TransportHandle& handle)
{
	auto& bh = cast(handle);

	// report bad URLs the same way as network errors
	if (bh.url_error())
	{
		bh.fail(bh.url_error());
		m_messages.push_back(Completion{&bh, bh.url_error()});
		return;
	}

	m_running.insert(&bh);
	bh.start([this, &bh](std::error_code ec)
	{
		m_running.erase(&bh);
		m_messages.push_back(Completion{&bh, ec});
	});
}

void BeastMultiplexer::remove(TransportHandle& handle)
{
	auto& bh = cast(handle);
	if (m_running.erase(&bh) > 0)
		bh.cancel();

	m_messages.erase(
		std::remove_if(m_messages.begin(), m_messages.end(), [&bh](auto& msg){return msg.handle == &bh;}),
		m_messages.end()
	);
}

Multiplexer::Status BeastMultiplexer::perform(std::size_t& running)
{
	running = m_running.size();
	if (m_error)
		return Status::fatal;

	try
	{
		// poll() returns immediately when the io_context has no work, and
		// then it must be restarted before it can be run again.
		if (m_ioc.stopped())
			m_ioc.restart();

		auto count = m_ioc.poll();
		running = m_running.size();
		return count > 0 ? Status::call_again : Status::ok;
	}
	catch (std::exception& e)
	{
		Log(LOG_ERR, "exception from I/O handler: %1%", e.what());
		m_error = Error::multiplexer_failure;
		return Status::fatal;
	}
}

std::optional<Completion> BeastMultiplexer::info_read()
{
	if (m_messages.empty())
		return std::nullopt;

	auto msg = m_messages.front();
	m_messages.pop_front();
	return msg;
}

int BeastMultiplexer::wait(std::chrono::microseconds timeout)
{
	if (m_error)
		return -1;

	try
	{
		if (m_ioc.stopped())
			m_ioc.restart();

		return static_cast<int>(m_ioc.run_one_for(timeout));
	}
	catch (std::exception& e)
	{
		// perform() will report the failure
		Log(LOG_ERR, "exception from I/O handler: %1%", e.what());
		m_error = Error::multiplexer_failure;
		return -1;
	}
}

} // end of namespace mf
