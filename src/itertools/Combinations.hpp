#pragma once

#include "runtime/Object.hpp"

#include <atomic>
#include <mutex>

namespace lazyiter {
namespace itertools {
	// r-length subsequences of the pool in lexicographic index order, without repeated elements.
	class Combinations : public Iterator
	{
		const std::vector<Value> m_pool;
		// strictly increasing, every value < m_pool.size()
		std::vector<size_t> m_indices;
		const size_t m_r;
		std::atomic<bool> m_exhausted;
		std::mutex m_mutex;

		Combinations(std::vector<Value> pool, size_t r);

	  public:
		static Result<std::shared_ptr<Combinations>> create(const Value &iterable,
			const BigIntType &r);

		std::string type_name() const override { return "itertools.combinations"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};

	// r-length subsequences of the pool in lexicographic index order, elements may repeat.
	class CombinationsWithReplacement : public Iterator
	{
		const std::vector<Value> m_pool;
		// non-decreasing, every value < m_pool.size()
		std::vector<size_t> m_indices;
		const size_t m_r;
		std::atomic<bool> m_exhausted;
		std::mutex m_mutex;

		CombinationsWithReplacement(std::vector<Value> pool, size_t r);

	  public:
		static Result<std::shared_ptr<CombinationsWithReplacement>> create(const Value &iterable,
			const BigIntType &r);

		std::string type_name() const override
		{
			return "itertools.combinations_with_replacement";
		}
		std::string to_string() const override;

		Result<Value> next() override;
	};

	// Shared validation of the `r` argument. Negative is a ValueError, above max_index an
	// OverflowError.
	Result<size_t> validate_r(const BigIntType &r);
}// namespace itertools
}// namespace lazyiter
