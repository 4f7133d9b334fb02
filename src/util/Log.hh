/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#pragma once

#include <boost/format.hpp>

#include <syslog.h>

#include <string>

namespace mf {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

// Send log messages to stderr as well as syslog, and drop everything less
// important than "level".
void OpenLog(const char *ident, bool to_stderr, int level);

template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
