#pragma once

#include "runtime/Object.hpp"

#include <shared_mutex>

namespace lazyiter {
namespace itertools {
	class Pairwise : public Iterator
	{
		std::shared_ptr<Iterator> m_iterator;
		Value m_old;
		mutable std::shared_mutex m_mutex;

		Pairwise(std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<Pairwise>> create(const Value &iterable);

		std::string type_name() const override { return "itertools.pairwise"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
