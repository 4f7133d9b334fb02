/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the multifetch
	distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#include "Dispatcher.hh"

#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <numeric>
#include <thread>

namespace mf {

Dispatcher::Dispatcher(Multiplexer& mux, int max_concurrency, bool debug) : m_mux{mux}
{
	configure(max_concurrency, debug);
}

void Dispatcher::configure(int max_concurrency, bool debug)
{
	m_limit = max_concurrency > 0 ? static_cast<std::size_t>(max_concurrency) : default_concurrency;
	m_debug = debug;
}

std::vector<Response> Dispatcher::fetch(std::vector<Target> targets)
{
	try
	{
		init(std::move(targets));
		run();
	}
	catch (...)
	{
		// outstanding requests must be cancelled before the handles are destroyed
		release();
		throw;
	}

	release();
	return collect();
}

void Dispatcher::init(std::vector<Target>&& targets)
{
	m_targets = std::move(targets);
	m_results.assign(m_targets.size(), std::nullopt);

	m_pending.resize(m_targets.size());
	std::iota(m_pending.begin(), m_pending.end(), 0);

	// slots are created on demand by find_free()
	m_slots.clear();
	m_slots.resize(m_limit);

	m_stat = Statistics{};
	m_stat.assignments.assign(m_limit, 0);

	fill();
	update_state();
}

bool Dispatcher::fill()
{
	if (m_pending.empty())
		return false;

	auto started = false;
	while (!m_pending.empty())
	{
		auto free = find_free();
		if (!free)
			break;

		auto& slot = m_slots[*free];

		// the last target goes first
		slot.target_index = m_pending.back();
		m_pending.pop_back();

		slot.handle->configure(m_targets[slot.target_index]);
		m_mux.add(*slot.handle);
		slot.busy = true;

		m_stat.assignments[*free]++;
		m_stat.schedule.push_back(slot.target_index);
		m_stat.peak_busy = std::max(m_stat.peak_busy, active());

		started = true;
		report();
	}
	return started;
}

std::optional<std::size_t> Dispatcher::find_free()
{
	for (std::size_t i = 0; i < m_slots.size(); ++i)
	{
		auto& slot = m_slots[i];
		if (!slot.handle)
		{
			slot.handle = m_mux.create_handle();
			m_stat.slots_created++;
			return i;
		}

		if (!slot.busy)
			return i;
	}
	return std::nullopt;
}

std::size_t Dispatcher::find(const TransportHandle *handle) const
{
	auto it = std::find_if(m_slots.begin(), m_slots.end(), [handle](auto& slot)
	{
		return slot.handle && slot.handle.get() == handle;
	});
	if (it == m_slots.end())
		BOOST_THROW_EXCEPTION(UnknownHandle() << Message{"completed handle does not belong to any slot"});

	auto index = static_cast<std::size_t>(it - m_slots.begin());
	if (!it->busy)
		BOOST_THROW_EXCEPTION(UnknownHandle()
			<< SlotIndex{index}
			<< Message{"completed handle belongs to an idle slot"}
		);

	return index;
}

void Dispatcher::complete(const Completion& msg)
{
	auto index = find(msg.handle);
	auto& slot = m_slots[index];

	auto& entry = m_results.at(slot.target_index);
	if (entry)
		BOOST_THROW_EXCEPTION(UnknownHandle()
			<< SlotIndex{index}
			<< TargetIndex{slot.target_index}
			<< Message{"target completed twice"}
		);

	entry = slot.handle->content();
	if (!entry->error && msg.result)
		entry->error = msg.result;

	if (entry->failed())
		Log(LOG_INFO, "%1% failed: %2% (%3%)", slot.handle->target().str(), entry->error.message(), entry->error);

	// keep the handle for the next target
	m_mux.remove(*slot.handle);
	slot.busy = false;
	slot.target_index = Slot::idle_index;
}

std::size_t Dispatcher::drain()
{
	std::size_t count = 0;
	while (auto msg = m_mux.info_read())
	{
		complete(*msg);
		report();

		// reuse the slot immediately
		fill();
		update_state();
		count++;
	}
	return count;
}

void Dispatcher::run()
{
	while (m_state != State::done)
	{
		std::size_t running = 0;
		std::size_t completed = 0;

		auto status = Multiplexer::Status::ok;
		do
		{
			status = m_mux.perform(running);
			if (status == Multiplexer::Status::fatal)
				BOOST_THROW_EXCEPTION(MultiplexerFailure()
					<< ErrorCode{m_mux.last_error()}
					<< Message{"multiplexer cannot make progress"}
				);

			completed += drain();

			if (status == Multiplexer::Status::call_again)
				std::this_thread::sleep_for(m_retry_delay);

		} while (status == Multiplexer::Status::call_again);

		// Nothing finished but some connections are still open. Wait for them
		// instead of spinning.
		if (completed == 0 && running > 0 && m_state != State::done && m_mux.wait(m_wait_timeout) < 0)
			std::this_thread::sleep_for(m_retry_delay);
	}
}

void Dispatcher::release()
{
	for (auto&& slot : m_slots)
	{
		if (slot.busy)
		{
			m_mux.remove(*slot.handle);
			slot.busy = false;
			slot.target_index = Slot::idle_index;
		}
	}
	m_slots.clear();
	m_pending.clear();
	m_targets.clear();
	m_state = State::done;
}

std::vector<Response> Dispatcher::collect()
{
	std::vector<Response> result;
	result.reserve(m_results.size());
	for (std::size_t i = 0; i < m_results.size(); ++i)
	{
		if (!m_results[i])
			BOOST_THROW_EXCEPTION(Error() << TargetIndex{i} << Message{"no result for target"});

		result.push_back(std::move(*m_results[i]));
	}
	m_results.clear();
	return result;
}

std::size_t Dispatcher::active() const
{
	return static_cast<std::size_t>(std::count_if(m_slots.begin(), m_slots.end(), [](auto& slot){return slot.busy;}));
}

void Dispatcher::update_state()
{
	if (active() == 0 && m_pending.empty())
	{
		if (m_state != State::done && m_debug)
			Log(LOG_DEBUG, "all %1% targets done", m_results.size());
		m_state = State::done;
	}
	else
		m_state = m_pending.empty() ? State::draining : State::running;
}

void Dispatcher::report() const
{
	if (m_debug)
		Log(LOG_DEBUG, "Active: %1% / Left: %2%", active(), left());

	if (m_observer)
		m_observer(active(), left());
}

} // end of namespace mf
