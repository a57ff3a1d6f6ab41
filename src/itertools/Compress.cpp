#include "Compress.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	Compress::Compress(std::shared_ptr<Iterator> data, std::shared_ptr<Iterator> selectors)
		: m_data(std::move(data)), m_selectors(std::move(selectors))
	{}

	Result<std::shared_ptr<Compress>> Compress::create(const Value &data, const Value &selectors)
	{
		auto data_iterator = lazyiter::iter(data);
		if (data_iterator.is_err()) { return Err(data_iterator.unwrap_err()); }
		auto selectors_iterator = lazyiter::iter(selectors);
		if (selectors_iterator.is_err()) { return Err(selectors_iterator.unwrap_err()); }

		spdlog::trace("itertools.compress: created");
		return Ok(std::shared_ptr<Compress>(
			new Compress(data_iterator.unwrap(), selectors_iterator.unwrap())));
	}

	std::string Compress::to_string() const
	{
		return fmt::format("<itertools.compress object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Compress::next()
	{
		while (true) {
			auto selector = m_selectors->next();
			if (selector.is_err()) { return selector; }
			auto verdict = truthy(selector.unwrap());
			if (verdict.is_err()) { return Err(verdict.unwrap_err()); }

			// data is consumed in lockstep with the selectors, also when the selector is falsy
			auto data = m_data->next();
			if (data.is_err()) { return data; }

			if (verdict.unwrap()) { return data; }
		}
	}

}// namespace itertools
}// namespace lazyiter
