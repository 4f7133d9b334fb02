/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/5/20.
//

#pragma once

#include "fetch/Transport.hh"

#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace mf::test {

class ScriptedMultiplexer;

/// A transport handle that completes after a number of perform() calls
/// decided by its multiplexer.
class ScriptedHandle : public TransportHandle
{
public:
	explicit ScriptedHandle(ScriptedMultiplexer& parent) : m_parent{parent} {}

	void configure(const Target& target) override;
	const Target& target() const override {return m_target;}
	Response content() override {return m_response;}

	std::size_t configured() const {return m_configured;}

private:
	friend class ScriptedMultiplexer;

	ScriptedMultiplexer& m_parent;
	Target      m_target;
	Response    m_response;
	std::size_t m_remaining{0};
	std::size_t m_configured{0};
};

/// \brief  An in-memory multiplexer for testing the Dispatcher.
///
/// Every target succeeds with "payload of <url>" as body after a random number
/// of perform() calls, unless another outcome is scripted for its URL. It also
/// checks that handles are added and removed in pairs.
class ScriptedMultiplexer : public Multiplexer
{
public:
	struct Outcome
	{
		std::error_code error;
		unsigned        status{200};
		std::string     body;
	};

public:
	explicit ScriptedMultiplexer(std::size_t min_latency = 1, std::size_t max_latency = 1, unsigned seed = 0);

	// scripting
	void script(const std::string& url, Outcome outcome);
	void fail(const std::string& url, std::error_code ec);
	void latency(const std::string& url, std::size_t steps);
	void call_again_every(std::size_t n) {m_call_again_every = n;}
	void fatal_after(std::size_t performs) {m_fatal_after = performs;}

	// Multiplexer
	std::unique_ptr<TransportHandle> create_handle() override;
	void add(TransportHandle& handle) override;
	void remove(TransportHandle& handle) override;
	Status perform(std::size_t& running) override;
	std::optional<Completion> info_read() override;
	int wait(std::chrono::microseconds timeout) override;
	std::error_code last_error() const override;

	// observations
	std::size_t handles_created() const {return m_created;}
	std::size_t registered() const {return m_registered.size();}
	std::size_t peak_registered() const {return m_peak;}
	std::size_t performs() const {return m_performs;}
	std::size_t waits() const {return m_waits;}
	std::size_t violations() const {return m_violations;}
	std::size_t cancelled() const {return m_cancelled;}
	const std::vector<std::string>& started() const {return m_started;}
	const std::vector<std::string>& finished() const {return m_finished;}

	static std::string payload(const std::string& url);

private:
	friend class ScriptedHandle;

	std::map<std::string, Outcome>      m_outcomes;
	std::map<std::string, std::size_t>  m_latency;
	std::mt19937                        m_rand;
	std::uniform_int_distribution<std::size_t> m_dist;

	std::set<ScriptedHandle*>   m_registered;
	std::set<ScriptedHandle*>   m_in_flight;
	std::vector<Completion>     m_messages;

	std::size_t m_call_again_every{0};
	std::size_t m_fatal_after{0};

	std::size_t m_created{0};
	std::size_t m_peak{0};
	std::size_t m_performs{0};
	std::size_t m_waits{0};
	std::size_t m_violations{0};
	std::size_t m_cancelled{0};
	std::vector<std::string> m_started;
	std::vector<std::string> m_finished;
};

} // end of namespace mf::test
