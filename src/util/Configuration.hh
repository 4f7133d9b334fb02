/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#pragma once

#include "Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/filesystem/path.hpp>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace mf {

/// \brief  Parsing command line options and configuration file
///
/// Options on the command line override the ones in the configuration file.
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    boost::filesystem::path>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	int concurrency() const {return m_concurrency;}
	bool debug() const {return m_debug;}
	std::chrono::seconds timeout() const {return m_timeout;}
	const std::string& user_agent() const {return m_user_agent;}
	bool include_header() const {return m_include_header;}
	bool fail_on_http_error() const {return m_fail_on_http_error;}
	std::uint64_t body_limit() const {return m_body_limit;}
	bool insecure() const {return m_insecure;}

	// URLs from configuration file, input file and command line, in that order
	const std::vector<std::string>& urls() const {return m_urls;}
	const boost::filesystem::path& output_dir() const {return m_output_dir;}

	bool help() const {return m_args.count("help") > 0;}

	void usage(std::ostream& out) const;

private:
	void load_config(const boost::filesystem::path& path);
	void load_urls(const boost::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	int                     m_concurrency{5};
	bool                    m_debug{false};
	std::chrono::seconds    m_timeout{30};
	std::string             m_user_agent;
	bool                    m_include_header{false};
	bool                    m_fail_on_http_error{false};
	std::uint64_t           m_body_limit{8 * 1024 * 1024};
	bool                    m_insecure{false};

	std::vector<std::string>    m_urls;
	boost::filesystem::path     m_output_dir;
};

} // end of namespace
