/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#include "Configuration.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>

#include <fstream>

namespace po = boost::program_options;

namespace mf {

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",            "produce help message")
		("cfg",             po::value<std::string>()->value_name("path"),
			"Configuration file. Use environment variable MULTIFETCH_CONFIG to set default path.")
		("concurrency,c",   po::value<int>()->value_name("n"), "maximum number of requests in flight (default 5)")
		("debug,d",         "print progress of the requests")
		("timeout",         po::value<long>()->value_name("sec"), "timeout of each network operation in seconds (default 30)")
		("user-agent",      po::value<std::string>()->value_name("string"), "value of the User-Agent header")
		("include-header",  "keep the response header in the result")
		("fail-on-error",   "treat HTTP status 400 or above as failure")
		("body-limit",      po::value<std::uint64_t>()->value_name("bytes"), "maximum size of a response body (default 8MiB)")
		("insecure,k",      "do not verify the certificates of HTTPS servers")
		("input,i",         po::value<std::string>()->value_name("file"), "read URLs from a file, one per line")
		("output-dir,o",    po::value<std::string>()->value_name("dir"), "save the response bodies in this directory")
		("url",             po::value<std::vector<std::string>>()->value_name("URL"), "URL to fetch")
	;

	po::positional_options_description pos;
	pos.add("url", -1);

	if (argc > 0)
	{
		store(po::command_line_parser(argc, argv).options(m_desc).positional(pos).run(), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (help())
		return;

	if (m_args.count("cfg") > 0)
		load_config(m_args["cfg"].as<std::string>());
	else if (env && *env)
		load_config(env);

	if (m_args.count("concurrency"))
		m_concurrency = m_args["concurrency"].as<int>();
	if (m_args.count("debug"))
		m_debug = true;
	if (m_args.count("timeout"))
		m_timeout = std::chrono::seconds{m_args["timeout"].as<long>()};
	if (m_args.count("user-agent"))
		m_user_agent = m_args["user-agent"].as<std::string>();
	if (m_args.count("include-header"))
		m_include_header = true;
	if (m_args.count("fail-on-error"))
		m_fail_on_http_error = true;
	if (m_args.count("body-limit"))
		m_body_limit = m_args["body-limit"].as<std::uint64_t>();
	if (m_args.count("insecure"))
		m_insecure = true;
	if (m_args.count("output-dir"))
		m_output_dir = m_args["output-dir"].as<std::string>();

	if (m_args.count("input"))
		load_urls(m_args["input"].as<std::string>());
	if (m_args.count("url"))
	{
		auto&& urls = m_args["url"].as<std::vector<std::string>>();
		m_urls.insert(m_urls.end(), urls.begin(), urls.end());
	}
}

void Configuration::usage(std::ostream &out) const
{
	out << "Usage: multifetch [options] [URL...]\n\n" << m_desc;
}

void Configuration::load_config(const boost::filesystem::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		m_concurrency       = json.value(jptr{"/concurrency"}, m_concurrency);
		m_debug             = json.value(jptr{"/debug"}, m_debug);
		m_timeout           = std::chrono::seconds{json.value(jptr{"/timeout_sec"}, static_cast<long>(m_timeout.count()))};
		m_user_agent        = json.value(jptr{"/user_agent"}, m_user_agent);
		m_include_header    = json.value(jptr{"/include_header"}, m_include_header);
		m_fail_on_http_error= json.value(jptr{"/fail_on_http_error"}, m_fail_on_http_error);
		m_body_limit        = json.value(jptr{"/body_limit"}, m_body_limit);
		m_insecure          = json.value(jptr{"/insecure"}, m_insecure);

		// relative to the configuration file
		if (auto dir = json.value(jptr{"/output_dir"}, std::string{}); !dir.empty())
			m_output_dir = boost::filesystem::absolute(dir, path.parent_path());

		for (auto&& url : json.value(jptr{"/urls"}, std::vector<std::string>{}))
			m_urls.push_back(url);
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

void Configuration::load_urls(const boost::filesystem::path& path)
{
	std::ifstream file{path.string()};
	if (!file)
	{
		BOOST_THROW_EXCEPTION(FileError()
			<< ErrorCode({errno, std::system_category()})
			<< Path{path}
		);
	}

	std::string line;
	while (std::getline(file, line))
	{
		boost::algorithm::trim(line);
		if (!line.empty() && line.front() != '#')
			m_urls.push_back(line);
	}
}

} // end of namespace
