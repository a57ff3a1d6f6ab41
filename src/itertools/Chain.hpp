#pragma once

#include "runtime/Object.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {
	class Chain : public Iterator
	{
		const std::vector<Value> m_iterables;
		size_t m_current_index{ 0 };
		// null exactly when the iterable at m_current_index has not been opened yet
		std::shared_ptr<Iterator> m_cached_iterator;
		std::mutex m_mutex;

		Chain(std::vector<Value> &&iterables);

	  public:
		static Result<std::shared_ptr<Chain>> create(std::vector<Value> iterables);
		static Result<std::shared_ptr<Chain>> from_iterable(const Value &iterable);

		std::string type_name() const override { return "itertools.chain"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
