#include "Pairwise.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/api.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {

	Pairwise::Pairwise(std::shared_ptr<Iterator> iterator) : m_iterator(std::move(iterator)) {}

	Result<std::shared_ptr<Pairwise>> Pairwise::create(const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[](std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<Pairwise>> {
				spdlog::trace("itertools.pairwise: created");
				return Ok(std::shared_ptr<Pairwise>(new Pairwise(std::move(iterator))));
			});
	}

	std::string Pairwise::to_string() const
	{
		return fmt::format("<itertools.pairwise object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Pairwise::next()
	{
		Value old;
		{
			std::shared_lock lock{ m_mutex };
			old = m_old;
		}
		if (!old) {
			auto first = m_iterator->next();
			if (first.is_err()) { return first; }
			old = first.unwrap();
		}

		auto new_ = m_iterator->next();
		if (new_.is_err()) { return new_; }

		std::unique_lock lock{ m_mutex };
		m_old = new_.unwrap();
		return Ok(Tuple::create(old, new_.unwrap()));
	}

}// namespace itertools
}// namespace lazyiter
