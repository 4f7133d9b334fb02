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

#include "Transport.hh"

#include "util/Exception.hh"

#include <boost/exception/error_info.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace mf {

/// \brief  Fetches a list of targets with at most N requests in flight.
///
/// The dispatcher keeps a pool of N slots, each owning one reusable transport
/// handle. Slots are created on demand and reused for the following targets
/// once their request completes. Pending targets are started from the back of
/// the list, but every response is stored at the index of its target, so the
/// result of fetch() is always in the same order as its input.
///
/// All work happens in the thread calling fetch(), which drives the
/// Multiplexer until every target is done.
class Dispatcher
{
public:
	struct Error : virtual Exception {};
	struct MultiplexerFailure : virtual Error {};
	struct UnknownHandle : virtual Error {};
	using TargetIndex = boost::error_info<struct tag_target_index, std::size_t>;
	using SlotIndex   = boost::error_info<struct tag_slot_index,   std::size_t>;

	static constexpr std::size_t default_concurrency = 5;

	enum class State {running, draining, done};

	struct Statistics
	{
		std::size_t slots_created{0};
		std::size_t peak_busy{0};

		// number of targets served by each slot
		std::vector<std::size_t> assignments;

		// target indices in the order they were started
		std::vector<std::size_t> schedule;
	};

	// Called with the number of active slots and the number of pending targets
	// every time a target is started or completed.
	using Observer = std::function<void(std::size_t active, std::size_t left)>;

public:
	explicit Dispatcher(Multiplexer& mux, int max_concurrency = default_concurrency, bool debug = false);

	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator=(const Dispatcher&) = delete;

	// Takes effect on the next fetch().
	void configure(int max_concurrency, bool debug);

	template <typename Callback>
	void observe(Callback&& callback) {m_observer = std::forward<Callback>(callback);}

	std::vector<Response> fetch(std::vector<Target> targets);

	std::size_t max_concurrency() const {return m_limit;}
	bool debug() const {return m_debug;}
	const Statistics& statistics() const {return m_stat;}

	// Progress of the current fetch()
	std::size_t active() const;
	std::size_t left() const {return m_pending.size();}
	State state() const {return m_state;}

	void wait_timeout(std::chrono::microseconds timeout) {m_wait_timeout = timeout;}

private:
	struct Slot
	{
		static constexpr std::size_t idle_index = static_cast<std::size_t>(-1);

		std::unique_ptr<TransportHandle>    handle;
		std::size_t                         target_index{idle_index};
		bool                                busy{false};
	};

	void init(std::vector<Target>&& targets);
	bool fill();
	std::optional<std::size_t> find_free();
	std::size_t find(const TransportHandle *handle) const;
	void complete(const Completion& msg);
	std::size_t drain();
	void run();
	void release();
	std::vector<Response> collect();
	void update_state();
	void report() const;

private:
	Multiplexer&    m_mux;
	std::size_t     m_limit{default_concurrency};
	bool            m_debug{false};

	std::chrono::microseconds   m_wait_timeout{1000};
	std::chrono::microseconds   m_retry_delay{10};

	// states of the current fetch()
	std::vector<Target>                     m_targets;
	std::vector<std::size_t>                m_pending;
	std::vector<std::optional<Response>>    m_results;
	std::vector<Slot>                       m_slots;
	State                                   m_state{State::done};

	Statistics  m_stat;
	Observer    m_observer;
};

} // end of namespace mf
