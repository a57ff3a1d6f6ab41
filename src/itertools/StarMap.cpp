#include "StarMap.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	StarMap::StarMap(Value function, std::shared_ptr<Iterator> iterator)
		: m_function(std::move(function)), m_iterator(std::move(iterator))
	{}

	Result<std::shared_ptr<StarMap>> StarMap::create(Value function, const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[&function](std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<StarMap>> {
				spdlog::trace("itertools.starmap: created");
				return Ok(std::shared_ptr<StarMap>(
					new StarMap(std::move(function), std::move(iterator))));
			});
	}

	std::string StarMap::to_string() const
	{
		return fmt::format("<itertools.starmap object at {}>", static_cast<const void *>(this));
	}

	Result<Value> StarMap::next()
	{
		auto current_args = m_iterator->next();
		if (current_args.is_err()) { return current_args; }

		auto args = extract_elements(current_args.unwrap());
		if (args.is_err()) { return Err(args.unwrap_err()); }

		return lazyiter::call(m_function, args.unwrap());
	}

}// namespace itertools
}// namespace lazyiter
