#pragma once

#include "runtime/Object.hpp"

#include <atomic>

namespace lazyiter {
namespace itertools {
	class DropWhile : public Iterator
	{
		Value m_predicate;
		std::shared_ptr<Iterator> m_iterator;
		std::atomic<bool> m_start_flag{ false };

		DropWhile(Value predicate, std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<DropWhile>> create(Value predicate, const Value &iterable);

		std::string type_name() const override { return "itertools.dropwhile"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
