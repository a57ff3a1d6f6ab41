#include "ZipLongest.hpp"
#include "runtime/NoneType.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	ZipLongest::ZipLongest(std::vector<std::shared_ptr<Iterator>> iterators, Value fillvalue)
		: m_iterators(std::move(iterators)), m_fillvalue(std::move(fillvalue)),
		  m_active(m_iterators.size())
	{}

	Result<std::shared_ptr<ZipLongest>> ZipLongest::create(const std::vector<Value> &iterables,
		Value fillvalue)
	{
		std::vector<std::shared_ptr<Iterator>> iterators;
		iterators.reserve(iterables.size());
		for (const auto &iterable : iterables) {
			auto iterator = lazyiter::iter(iterable);
			if (iterator.is_err()) { return Err(iterator.unwrap_err()); }
			iterators.push_back(iterator.unwrap());
		}
		if (!fillvalue) { fillvalue = none(); }

		spdlog::trace("itertools.zip_longest: created with {} iterators", iterators.size());
		return Ok(std::shared_ptr<ZipLongest>(
			new ZipLongest(std::move(iterators), std::move(fillvalue))));
	}

	std::string ZipLongest::to_string() const
	{
		return fmt::format("<itertools.zip_longest object at {}>", static_cast<const void *>(this));
	}

	Result<Value> ZipLongest::next()
	{
		std::vector<std::shared_ptr<Iterator>> iterators;
		{
			std::scoped_lock lock{ m_mutex };
			if (m_active == 0) { return Err(stop_iteration()); }
			iterators = m_iterators;
		}

		std::vector<Value> result;
		result.reserve(iterators.size());
		for (size_t i = 0; i < iterators.size(); ++i) {
			if (!iterators[i]) {
				result.push_back(m_fillvalue);
				continue;
			}
			auto value = iterators[i]->next();
			if (value.is_ok()) {
				result.push_back(value.unwrap());
				continue;
			}
			if (!is_stop_iteration(value.unwrap_err())) { return value; }

			std::scoped_lock lock{ m_mutex };
			if (m_iterators[i]) {
				m_iterators[i] = nullptr;
				--m_active;
				spdlog::debug("itertools.zip_longest: iterator {} exhausted, {} still active",
					i,
					m_active);
			}
			if (m_active == 0) { return Err(stop_iteration()); }
			result.push_back(m_fillvalue);
		}

		return Ok(Tuple::create(std::move(result)));
	}

}// namespace itertools
}// namespace lazyiter
