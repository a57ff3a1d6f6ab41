#include "Permutations.hpp"
#include "Combinations.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/api.hpp"

#include <algorithm>
#include <numeric>

namespace lazyiter {
namespace itertools {

	Permutations::Permutations(std::vector<Value> pool, size_t r)
		: m_pool(std::move(pool)), m_indices(m_pool.size()), m_r(r), m_exhausted(r > m_pool.size())
	{
		const auto n = m_pool.size();
		std::iota(m_indices.begin(), m_indices.end(), size_t{ 0 });
		m_cycles.reserve(std::min(r, n));
		for (size_t i = 0; i < std::min(r, n); ++i) { m_cycles.push_back(n - i); }
	}

	Result<std::shared_ptr<Permutations>> Permutations::create(const Value &iterable,
		const std::optional<BigIntType> &r)
	{
		auto pool = extract_elements(iterable);
		if (pool.is_err()) { return Err(pool.unwrap_err()); }

		size_t r_ = pool.unwrap().size();
		if (r.has_value()) {
			auto validated = validate_r(*r);
			if (validated.is_err()) { return Err(validated.unwrap_err()); }
			r_ = validated.unwrap();
		}

		spdlog::trace("itertools.permutations: created with pool of size {} and r={}",
			pool.unwrap().size(),
			r_);
		return Ok(std::shared_ptr<Permutations>(new Permutations(pool.unwrap(), r_)));
	}

	std::string Permutations::to_string() const
	{
		return fmt::format(
			"<itertools.permutations object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Permutations::next()
	{
		std::scoped_lock lock{ m_mutex };
		if (m_exhausted.load()) { return Err(stop_iteration()); }

		const auto n = m_pool.size();
		if (n == 0) {
			m_exhausted.store(true);
			return Ok(Tuple::create());
		}

		if (!m_result.has_value()) {
			m_result = std::vector<size_t>(m_indices.begin(), m_indices.begin() + m_r);
		} else {
			auto &result = *m_result;
			bool advanced = false;
			// decrement the rightmost cycle counter, moving left on rollover
			for (size_t i = m_r; i > 0; --i) {
				const auto position = i - 1;
				--m_cycles[position];
				if (m_cycles[position] == 0) {
					std::rotate(m_indices.begin() + position,
						m_indices.begin() + position + 1,
						m_indices.end());
					m_cycles[position] = n - position;
				} else {
					std::swap(m_indices[position], m_indices[n - m_cycles[position]]);
					for (size_t k = position; k < m_r; ++k) { result[k] = m_indices[k]; }
					advanced = true;
					break;
				}
			}
			if (!advanced) {
				m_exhausted.store(true);
				return Err(stop_iteration());
			}
		}

		std::vector<Value> values;
		values.reserve(m_r);
		for (const auto &idx : *m_result) { values.push_back(m_pool[idx]); }
		return Ok(Tuple::create(std::move(values)));
	}

}// namespace itertools
}// namespace lazyiter
