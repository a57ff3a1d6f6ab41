#include "Chain.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	Chain::Chain(std::vector<Value> &&iterables) : m_iterables(std::move(iterables)) {}

	Result<std::shared_ptr<Chain>> Chain::create(std::vector<Value> iterables)
	{
		spdlog::trace("itertools.chain: created over {} iterables", iterables.size());
		return Ok(std::shared_ptr<Chain>(new Chain(std::move(iterables))));
	}

	Result<std::shared_ptr<Chain>> Chain::from_iterable(const Value &iterable)
	{
		auto iterables = extract_elements(iterable);
		if (iterables.is_err()) { return Err(iterables.unwrap_err()); }
		return Chain::create(iterables.unwrap());
	}

	std::string Chain::to_string() const
	{
		return fmt::format("<itertools.chain object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Chain::next()
	{
		while (true) {
			size_t index = 0;
			std::shared_ptr<Iterator> current_iterator;
			{
				std::scoped_lock lock{ m_mutex };
				index = m_current_index;
				if (index >= m_iterables.size()) { break; }
				current_iterator = m_cached_iterator;
			}

			if (!current_iterator) {
				// opening an iterator may run arbitrary code, so it happens outside of the lock
				auto iterator = lazyiter::iter(m_iterables[index]);
				if (iterator.is_err()) { return Err(iterator.unwrap_err()); }
				current_iterator = iterator.unwrap();

				std::scoped_lock lock{ m_mutex };
				if (m_current_index != index) { continue; }
				m_cached_iterator = current_iterator;
			}

			auto value = current_iterator->next();
			if (value.is_ok() || !is_stop_iteration(value.unwrap_err())) { return value; }

			spdlog::debug("itertools.chain: iterable #{} exhausted", index);
			std::scoped_lock lock{ m_mutex };
			if (m_current_index == index) {
				++m_current_index;
				m_cached_iterator.reset();
			}
		}

		return Err(stop_iteration());
	}

}// namespace itertools
}// namespace lazyiter
