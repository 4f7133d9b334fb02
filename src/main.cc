/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/9/20.
//

#include "fetch/Dispatcher.hh"
#include "net/BeastTransport.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace mf {

void save(const boost::filesystem::path& dir, const std::vector<Response>& results)
{
	create_directories(dir);
	for (std::size_t i = 0; i < results.size(); ++i)
	{
		if (results[i].failed())
			continue;

		auto path = dir / std::to_string(i);
		std::ofstream file{path.string(), std::ios::out | std::ios::binary | std::ios::trunc};
		file << results[i].header << results[i].body;
		if (!file)
			Log(LOG_WARNING, "cannot write %1%", path.string());
	}
}

int Fetch(const Configuration& cfg)
{
	std::vector<Target> targets{cfg.urls().begin(), cfg.urls().end()};
	if (targets.empty())
		Log(LOG_NOTICE, "no URL to fetch");

	boost::asio::io_context ioc;
	ssl::context ctx{ssl::context::tls_client};
	ctx.set_default_verify_paths();

	TransportOptions opt;
	opt.timeout             = cfg.timeout();
	opt.user_agent          = cfg.user_agent();
	opt.include_header      = cfg.include_header();
	opt.fail_on_http_error  = cfg.fail_on_http_error();
	opt.body_limit          = cfg.body_limit();
	opt.insecure            = cfg.insecure();

	BeastMultiplexer mux{ioc, ctx, opt};
	Dispatcher dispatcher{mux, cfg.concurrency(), cfg.debug()};

	auto start = std::chrono::steady_clock::now();
	auto results = dispatcher.fetch(targets);
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	for (std::size_t i = 0; i < results.size(); ++i)
	{
		auto& res = results[i];
		std::cout << boost::format("%1% %2% %3% %4%\n")
			% i
			% (res.failed() ? res.error.message() : std::to_string(res.status))
			% res.body.size()
			% targets[i].str();
	}

	if (!cfg.output_dir().empty())
		save(cfg.output_dir(), results);

	auto failed = std::count_if(results.begin(), results.end(), [](auto& res){return res.failed();});
	Log(LOG_INFO, "fetched %1% URLs in %2% ms with %3% connections, %4% failed",
		results.size(), elapsed.count(), dispatcher.statistics().slots_created, failed
	);

	return failed == 0 ? EXIT_SUCCESS : 2;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace mf;
	try
	{
		OpenLog("multifetch", true, LOG_NOTICE);

		Configuration cfg{argc, argv, ::getenv(constants::config_env.data())};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		OpenLog("multifetch", true, cfg.debug() ? LOG_DEBUG : LOG_NOTICE);
		Log(LOG_DEBUG, "multifetch (version %1%) starting", constants::version);

		return Fetch(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
	catch (...)
	{
		Log(LOG_CRIT, "Uncaught unknown exception");
		return EXIT_FAILURE;
	}
}
