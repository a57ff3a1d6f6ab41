#pragma once

#include "runtime/Object.hpp"

#include <shared_mutex>

namespace lazyiter {
namespace itertools {
	class Cycle : public Iterator
	{
		std::shared_ptr<Iterator> m_iterator;
		// append-only while the source is live, read-only once m_replaying is set
		std::vector<Value> m_saved;
		bool m_replaying{ false };
		size_t m_index{ 0 };
		mutable std::shared_mutex m_mutex;

		Cycle(std::shared_ptr<Iterator> iterator);

	  public:
		static Result<std::shared_ptr<Cycle>> create(const Value &iterable);

		std::string type_name() const override { return "itertools.cycle"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
