#include "DropWhile.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	DropWhile::DropWhile(Value predicate, std::shared_ptr<Iterator> iterator)
		: m_predicate(std::move(predicate)), m_iterator(std::move(iterator))
	{}

	Result<std::shared_ptr<DropWhile>> DropWhile::create(Value predicate, const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[&predicate](std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<DropWhile>> {
				spdlog::trace("itertools.dropwhile: created");
				return Ok(std::shared_ptr<DropWhile>(
					new DropWhile(std::move(predicate), std::move(iterator))));
			});
	}

	std::string DropWhile::to_string() const
	{
		return fmt::format("<itertools.dropwhile object at {}>", static_cast<const void *>(this));
	}

	Result<Value> DropWhile::next()
	{
		if (m_start_flag.load()) { return m_iterator->next(); }

		while (true) {
			auto value = m_iterator->next();
			if (value.is_err()) { return value; }

			auto verdict = lazyiter::call(m_predicate, { value.unwrap() }).and_then(truthy);
			if (verdict.is_err()) { return Err(verdict.unwrap_err()); }

			if (!verdict.unwrap()) {
				spdlog::debug("itertools.dropwhile: predicate failed, forwarding from now on");
				m_start_flag.store(true);
				return value;
			}
		}
	}

}// namespace itertools
}// namespace lazyiter
