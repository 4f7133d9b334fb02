/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the multifetch
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#include "Error.hh"

#include <string>

namespace mf {

const std::error_category& mf_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "multifetch"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::malformed_url: return "malformed URL";
				case Error::unsupported_scheme: return "unsupported URL scheme";
				case Error::http_status: return "HTTP error status";
				case Error::multiplexer_failure: return "multiplexer failure";
				case Error::cancelled: return "request cancelled";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), mf_error_category());
}

} // end of namespace
