#pragma once

#include "runtime/Object.hpp"

#include <atomic>

namespace lazyiter {
namespace itertools {
	class TakeWhile : public Iterator
	{
		Value m_predicate;
		std::shared_ptr<Iterator> m_iterator;
		std::atomic<bool> m_stop_flag{ false };

		TakeWhile(Value predicate, std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<TakeWhile>> create(Value predicate, const Value &iterable);

		std::string type_name() const override { return "itertools.takewhile"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
