/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#include "Log.hh"

namespace mf {
namespace detail {

void DetailLog(int priority, std::string &&line)
{
	syslog(priority, "%s", line.c_str());
}

} // end of namespace detail

void OpenLog(const char *ident, bool to_stderr, int level)
{
	::openlog(ident, to_stderr ? LOG_PERROR : 0, LOG_USER);
	::setlogmask(LOG_UPTO(level));
}

} // end of namespace
