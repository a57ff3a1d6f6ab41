#pragma once

#include "runtime/Object.hpp"

namespace lazyiter {
namespace itertools {
	class FilterFalse : public Iterator
	{
		// null or None filters on the truthiness of the value itself
		Value m_predicate;
		std::shared_ptr<Iterator> m_iterator;

		FilterFalse(Value predicate, std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<FilterFalse>> create(Value predicate, const Value &iterable);

		std::string type_name() const override { return "itertools.filterfalse"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
