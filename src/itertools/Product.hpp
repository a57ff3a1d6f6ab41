#pragma once

#include "runtime/Object.hpp"

#include <atomic>
#include <mutex>

namespace lazyiter {
namespace itertools {
	class Product : public Iterator
	{
		const std::vector<std::vector<Value>> m_pools;
		std::vector<size_t> m_indices;
		std::atomic<bool> m_stop_flag{ false };
		std::mutex m_mutex;

		explicit Product(std::vector<std::vector<Value>> pools);

		void update_indices();

	  public:
		// product(*iterables, repeat=1). Every iterable is drained up front.
		static Result<std::shared_ptr<Product>> create(const std::vector<Value> &iterables,
			const BigIntType &repeat = 1);

		std::string type_name() const override { return "itertools.product"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
