#include "Accumulate.hpp"
#include "runtime/NoneType.hpp"
#include "runtime/api.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {

	Accumulate::Accumulate(std::shared_ptr<Iterator> iterator, Value binop, Value initial)
		: m_iterator(std::move(iterator)), m_binop(std::move(binop)), m_initial(std::move(initial))
	{
		if (m_binop == none()) { m_binop = nullptr; }
		if (m_initial == none()) { m_initial = nullptr; }
	}

	Result<std::shared_ptr<Accumulate>>
		Accumulate::create(const Value &iterable, Value func, Value initial)
	{
		return lazyiter::iter(iterable).and_then(
			[&func, &initial](
				std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<Accumulate>> {
				spdlog::trace("itertools.accumulate: created");
				return Ok(std::shared_ptr<Accumulate>(
					new Accumulate(std::move(iterator), std::move(func), std::move(initial))));
			});
	}

	std::string Accumulate::to_string() const
	{
		return fmt::format(
			"<itertools.accumulate object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Accumulate::next()
	{
		Value accumulated;
		{
			std::shared_lock lock{ m_mutex };
			accumulated = m_accumulated;
		}

		auto next_accumulated = [this, &accumulated]() -> Result<Value> {
			if (!accumulated) {
				if (m_initial) { return Ok(m_initial); }
				return m_iterator->next();
			}
			auto value = m_iterator->next();
			if (value.is_err()) { return value; }
			if (!m_binop) { return lazyiter::add(accumulated, value.unwrap()); }
			return lazyiter::call(m_binop, { accumulated, value.unwrap() });
		}();
		if (next_accumulated.is_err()) { return next_accumulated; }

		std::unique_lock lock{ m_mutex };
		m_accumulated = next_accumulated.unwrap();
		return next_accumulated;
	}

}// namespace itertools
}// namespace lazyiter
