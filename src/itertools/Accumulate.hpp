#pragma once

#include "runtime/Object.hpp"

#include <shared_mutex>

namespace lazyiter {
namespace itertools {
	class Accumulate : public Iterator
	{
		std::shared_ptr<Iterator> m_iterator;
		// binary function, addition when null
		Value m_binop;
		Value m_initial;
		Value m_accumulated;
		mutable std::shared_mutex m_mutex;

		Accumulate(std::shared_ptr<Iterator> iterator, Value binop, Value initial);

	  public:
		static Result<std::shared_ptr<Accumulate>>
			create(const Value &iterable, Value func = nullptr, Value initial = nullptr);

		std::string type_name() const override { return "itertools.accumulate"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
