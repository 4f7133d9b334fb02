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

#include <system_error>

namespace mf {

enum class Error
{
	ok,
	malformed_url,
	unsupported_scheme,
	http_status,
	multiplexer_failure,
	cancelled,

	unknown_error
};

const std::error_category& mf_error_category();
std::error_code make_error_code(Error err);

} // end of namespace mf

namespace std
{
	template <> struct is_error_code_enum<mf::Error> : true_type {};
}
