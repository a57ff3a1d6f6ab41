#include "Combinations.hpp"
#include "config.hpp"
#include "runtime/MemoryError.hpp"
#include "runtime/OverflowError.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/ValueError.hpp"
#include "runtime/api.hpp"

#include <new>
#include <numeric>

namespace lazyiter {
namespace itertools {

	namespace {
		std::shared_ptr<Tuple> select(const std::vector<Value> &pool,
			const std::vector<size_t> &indices)
		{
			std::vector<Value> result;
			result.reserve(indices.size());
			for (const auto &idx : indices) { result.push_back(pool[idx]); }
			return Tuple::create(std::move(result));
		}
	}// namespace

	Result<size_t> validate_r(const BigIntType &r)
	{
		if (r < 0) { return Err(value_error("r must be non-negative")); }
		if (r > Config::the().max_index) {
			return Err(overflow_error("r must be <= sys.maxsize, got {}", r.get_str()));
		}
		return Ok(static_cast<size_t>(r.get_ui()));
	}

	Combinations::Combinations(std::vector<Value> pool, size_t r)
		: m_pool(std::move(pool)), m_indices(r > m_pool.size() ? 0 : r), m_r(r),
		  m_exhausted(r > m_pool.size())
	{
		std::iota(m_indices.begin(), m_indices.end(), size_t{ 0 });
	}

	Result<std::shared_ptr<Combinations>> Combinations::create(const Value &iterable,
		const BigIntType &r)
	{
		auto pool = extract_elements(iterable);
		if (pool.is_err()) { return Err(pool.unwrap_err()); }
		auto r_ = validate_r(r);
		if (r_.is_err()) { return Err(r_.unwrap_err()); }

		spdlog::trace("itertools.combinations: created with pool of size {} and r={}",
			pool.unwrap().size(),
			r_.unwrap());
		return Ok(std::shared_ptr<Combinations>(new Combinations(pool.unwrap(), r_.unwrap())));
	}

	std::string Combinations::to_string() const
	{
		return fmt::format(
			"<itertools.combinations object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Combinations::next()
	{
		std::scoped_lock lock{ m_mutex };
		if (m_exhausted.load()) { return Err(stop_iteration()); }

		if (m_r == 0) {
			m_exhausted.store(true);
			return Ok(Tuple::create());
		}

		auto result = select(m_pool, m_indices);

		const auto n = m_pool.size();
		// rightmost index that has not reached its maximum value of i + n - r
		size_t i = m_r;
		while (i > 0 && m_indices[i - 1] == i - 1 + n - m_r) { --i; }

		if (i == 0) {
			m_exhausted.store(true);
		} else {
			++m_indices[i - 1];
			for (size_t j = i; j < m_r; ++j) { m_indices[j] = m_indices[j - 1] + 1; }
		}

		return Ok(result);
	}

	CombinationsWithReplacement::CombinationsWithReplacement(std::vector<Value> pool, size_t r)
		: m_pool(std::move(pool)), m_indices(m_pool.empty() ? 0 : r, 0), m_r(r),
		  m_exhausted(m_pool.empty() && r > 0)
	{}

	Result<std::shared_ptr<CombinationsWithReplacement>>
		CombinationsWithReplacement::create(const Value &iterable, const BigIntType &r)
	{
		auto pool = extract_elements(iterable);
		if (pool.is_err()) { return Err(pool.unwrap_err()); }
		auto r_ = validate_r(r);
		if (r_.is_err()) { return Err(r_.unwrap_err()); }

		spdlog::trace(
			"itertools.combinations_with_replacement: created with pool of size {} and r={}",
			pool.unwrap().size(),
			r_.unwrap());
		// a non-empty pool needs all r indices up front
		try {
			return Ok(std::shared_ptr<CombinationsWithReplacement>(
				new CombinationsWithReplacement(pool.unwrap(), r_.unwrap())));
		} catch (const std::bad_alloc &) {
			return Err(memory_error(allocation_size<size_t>(BigIntType{ r_.unwrap() })));
		}
	}

	std::string CombinationsWithReplacement::to_string() const
	{
		return fmt::format("<itertools.combinations_with_replacement object at {}>",
			static_cast<const void *>(this));
	}

	Result<Value> CombinationsWithReplacement::next()
	{
		std::scoped_lock lock{ m_mutex };
		if (m_exhausted.load()) { return Err(stop_iteration()); }

		if (m_r == 0) {
			m_exhausted.store(true);
			return Ok(Tuple::create());
		}

		auto result = select(m_pool, m_indices);

		const auto n = m_pool.size();
		size_t i = m_r;
		while (i > 0 && m_indices[i - 1] == n - 1) { --i; }

		if (i == 0) {
			m_exhausted.store(true);
		} else {
			const auto index = m_indices[i - 1] + 1;
			for (size_t j = i - 1; j < m_r; ++j) { m_indices[j] = index; }
		}

		return Ok(result);
	}

}// namespace itertools
}// namespace lazyiter
