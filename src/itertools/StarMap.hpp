#pragma once

#include "runtime/Object.hpp"

namespace lazyiter {
namespace itertools {
	class StarMap : public Iterator
	{
		Value m_function;
		std::shared_ptr<Iterator> m_iterator;

		StarMap(Value function, std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<StarMap>> create(Value function, const Value &iterable);

		std::string type_name() const override { return "itertools.starmap"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
