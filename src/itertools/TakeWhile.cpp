#include "TakeWhile.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	TakeWhile::TakeWhile(Value predicate, std::shared_ptr<Iterator> iterator)
		: m_predicate(std::move(predicate)), m_iterator(std::move(iterator))
	{}

	Result<std::shared_ptr<TakeWhile>> TakeWhile::create(Value predicate, const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[&predicate](std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<TakeWhile>> {
				spdlog::trace("itertools.takewhile: created");
				return Ok(std::shared_ptr<TakeWhile>(
					new TakeWhile(std::move(predicate), std::move(iterator))));
			});
	}

	std::string TakeWhile::to_string() const
	{
		return fmt::format("<itertools.takewhile object at {}>", static_cast<const void *>(this));
	}

	Result<Value> TakeWhile::next()
	{
		if (m_stop_flag.load()) { return Err(stop_iteration()); }

		auto value = m_iterator->next();
		if (value.is_err()) { return value; }

		auto verdict = lazyiter::call(m_predicate, { value.unwrap() }).and_then(truthy);
		if (verdict.is_err()) { return Err(verdict.unwrap_err()); }

		if (!verdict.unwrap()) {
			m_stop_flag.store(true);
			return Err(stop_iteration());
		}
		return value;
	}

}// namespace itertools
}// namespace lazyiter
