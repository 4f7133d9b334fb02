/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mf {

/// \brief  Identifies one fetchable resource, i.e. an URL.
class Target
{
public:
	Target() = default;
	Target(std::string url) : m_url{std::move(url)} {}
	Target(const char *url) : m_url{url} {}

	const std::string& str() const {return m_url;}

	friend bool operator==(const Target& lhs, const Target& rhs) {return lhs.m_url == rhs.m_url;}
	friend bool operator!=(const Target& lhs, const Target& rhs) {return lhs.m_url != rhs.m_url;}

private:
	std::string m_url;
};

/// \brief  Whatever the transport captured for one target.
///
/// A failed request carries an error code. The status and body may still be
/// filled when the transport received a response before it failed, e.g. an
/// HTTP 404 when the transport is asked to treat it as a failure.
struct Response
{
	std::error_code error;
	unsigned        status{0};
	std::string     header;
	std::string     body;

	bool failed() const {return static_cast<bool>(error);}
};

class TransportHandle;

/// One message from Multiplexer::info_read(): a handle finished its transfer.
struct Completion
{
	TransportHandle *handle{};
	std::error_code result;
};

/// \brief  A reusable channel that performs one request at a time.
///
/// The handle is created once per slot and reconfigured for every target.
/// It does not do anything until it is added to its multiplexer.
class TransportHandle
{
public:
	virtual ~TransportHandle() = default;

	virtual void configure(const Target& target) = 0;
	virtual const Target& target() const = 0;

	// The payload captured by the last completed transfer.
	virtual Response content() = 0;
};

/// \brief  Drives many transport handles from a single thread without blocking.
class Multiplexer
{
public:
	enum class Status
	{
		ok,             // progress made, nothing more to do right now
		call_again,     // more work is ready, perform() should be called again immediately
		fatal           // the multiplexer cannot make progress anymore
	};

	virtual ~Multiplexer() = default;

	virtual std::unique_ptr<TransportHandle> create_handle() = 0;

	// Registering a handle starts its transfer. Removing an in-flight handle cancels it.
	virtual void add(TransportHandle& handle) = 0;
	virtual void remove(TransportHandle& handle) = 0;

	// Advance all registered handles without blocking. "running" receives the
	// number of handles that have not finished yet.
	virtual Status perform(std::size_t& running) = 0;

	// Pop one completion message, if any.
	virtual std::optional<Completion> info_read() = 0;

	// Block until there is activity or the timeout expires. Returns the number
	// of events processed, or -1 if waiting is not possible.
	virtual int wait(std::chrono::microseconds timeout) = 0;

	// Why perform() returned Status::fatal.
	virtual std::error_code last_error() const = 0;
};

} // end of namespace mf
