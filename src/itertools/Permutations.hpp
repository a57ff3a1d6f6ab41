#pragma once

#include "runtime/Object.hpp"

#include <atomic>
#include <mutex>
#include <optional>

namespace lazyiter {
namespace itertools {
	class Permutations : public Iterator
	{
		const std::vector<Value> m_pool;
		// always a permutation of 0..n
		std::vector<size_t> m_indices;
		// one rollover counter per position of the result
		std::vector<size_t> m_cycles;
		// indices of the most recently returned result, empty before the first pull
		std::optional<std::vector<size_t>> m_result;
		const size_t m_r;
		std::atomic<bool> m_exhausted;
		std::mutex m_mutex;

		Permutations(std::vector<Value> pool, size_t r);

	  public:
		// permutations(iterable, r=None), where r defaults to the length of the pool
		static Result<std::shared_ptr<Permutations>> create(const Value &iterable,
			const std::optional<BigIntType> &r = std::nullopt);

		std::string type_name() const override { return "itertools.permutations"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
