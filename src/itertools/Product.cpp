#include "Product.hpp"
#include "config.hpp"
#include "runtime/MemoryError.hpp"
#include "runtime/OverflowError.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/ValueError.hpp"
#include "runtime/api.hpp"

#include <algorithm>
#include <new>

namespace lazyiter {
namespace itertools {

	Product::Product(std::vector<std::vector<Value>> pools)
		: m_pools(std::move(pools)), m_indices(m_pools.size(), 0)
	{}

	Result<std::shared_ptr<Product>> Product::create(const std::vector<Value> &iterables,
		const BigIntType &repeat)
	{
		if (repeat < 0) { return Err(value_error("repeat argument cannot be negative")); }
		if (repeat > Config::the().max_index) {
			return Err(overflow_error("repeat argument too large"));
		}

		std::vector<std::vector<Value>> pools;
		pools.reserve(iterables.size());
		for (const auto &iterable : iterables) {
			auto elements = extract_elements(iterable);
			if (elements.is_err()) { return Err(elements.unwrap_err()); }
			pools.push_back(elements.unwrap());
		}

		// zero pools yield a single empty tuple
		if (repeat == 0 || pools.empty()) {
			spdlog::trace("itertools.product: created with no pools");
			return Ok(std::shared_ptr<Product>(new Product(std::vector<std::vector<Value>>{})));
		}
		if (std::any_of(pools.begin(), pools.end(), [](const auto &pool) { return pool.empty(); })) {
			spdlog::trace("itertools.product: created with an empty pool");
			auto product = std::shared_ptr<Product>(new Product(std::move(pools)));
			product->m_stop_flag.store(true);
			return Ok(product);
		}

		const BigIntType total_pools = BigIntType{ pools.size() } * repeat;
		std::vector<std::vector<Value>> repeated_pools;
		if (total_pools > repeated_pools.max_size()) {
			return Err(memory_error(allocation_size<std::vector<Value>>(total_pools)));
		}
		const auto repeat_ = repeat.get_ui();
		try {
			repeated_pools.reserve(total_pools.get_ui());
			for (size_t i = 0; i < repeat_; ++i) {
				repeated_pools.insert(repeated_pools.end(), pools.begin(), pools.end());
			}
		} catch (const std::bad_alloc &) {
			return Err(memory_error(allocation_size<std::vector<Value>>(total_pools)));
		}

		spdlog::trace("itertools.product: created with {} pools", repeated_pools.size());
		auto product = std::shared_ptr<Product>(new Product(std::move(repeated_pools)));
		return Ok(product);
	}

	std::string Product::to_string() const
	{
		return fmt::format("<itertools.product object at {}>", static_cast<const void *>(this));
	}

	void Product::update_indices()
	{
		// odometer: the rightmost index advances first, carrying to the left when it rolls over
		for (size_t i = m_indices.size(); i > 0; --i) {
			const auto position = i - 1;
			if (m_indices[position] + 1 < m_pools[position].size()) {
				++m_indices[position];
				return;
			}
			m_indices[position] = 0;
		}
		m_stop_flag.store(true);
	}

	Result<Value> Product::next()
	{
		std::scoped_lock lock{ m_mutex };
		if (m_stop_flag.load()) { return Err(stop_iteration()); }

		std::vector<Value> result;
		result.reserve(m_pools.size());
		for (size_t i = 0; i < m_pools.size(); ++i) { result.push_back(m_pools[i][m_indices[i]]); }

		update_indices();

		return Ok(Tuple::create(std::move(result)));
	}

}// namespace itertools
}// namespace lazyiter
