#pragma once

#include <cstddef>
#include <limits>
#include <sys/types.h>

namespace lazyiter {
namespace itertools {

	struct Config
	{
		// Largest index, count or step accepted by islice, repeat, tee and the combinatoric
		// iterators. Arithmetic past this bound saturates instead of wrapping.
		size_t max_index{ static_cast<size_t>(std::numeric_limits<ssize_t>::max()) };

		size_t default_tee_copies{ 2 };

		static Config &the()
		{
			static Config s_config;
			return s_config;
		}
	};

}// namespace itertools
}// namespace lazyiter
