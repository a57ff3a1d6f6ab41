#include "FilterFalse.hpp"
#include "runtime/NoneType.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	FilterFalse::FilterFalse(Value predicate, std::shared_ptr<Iterator> iterator)
		: m_predicate(std::move(predicate)), m_iterator(std::move(iterator))
	{
		if (m_predicate == none()) { m_predicate = nullptr; }
	}

	Result<std::shared_ptr<FilterFalse>> FilterFalse::create(Value predicate, const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[&predicate](
				std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<FilterFalse>> {
				spdlog::trace("itertools.filterfalse: created");
				return Ok(std::shared_ptr<FilterFalse>(
					new FilterFalse(std::move(predicate), std::move(iterator))));
			});
	}

	std::string FilterFalse::to_string() const
	{
		return fmt::format(
			"<itertools.filterfalse object at {}>", static_cast<const void *>(this));
	}

	Result<Value> FilterFalse::next()
	{
		while (true) {
			auto value = m_iterator->next();
			if (value.is_err()) { return value; }

			auto verdict = [this, &value]() -> Result<bool> {
				if (!m_predicate) { return truthy(value.unwrap()); }
				return lazyiter::call(m_predicate, { value.unwrap() }).and_then(truthy);
			}();
			if (verdict.is_err()) { return Err(verdict.unwrap_err()); }

			if (!verdict.unwrap()) { return value; }
		}
	}

}// namespace itertools
}// namespace lazyiter
