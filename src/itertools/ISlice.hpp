#pragma once

#include "runtime/Object.hpp"

#include <atomic>
#include <optional>

namespace lazyiter {
namespace itertools {
	class ISlice : public Iterator
	{
		std::shared_ptr<Iterator> m_iterator;
		// number of values pulled from m_iterator so far
		std::atomic<size_t> m_current{ 0 };
		// index of the next value to return
		std::atomic<size_t> m_next;
		const std::optional<size_t> m_stop;
		const size_t m_step;
		const size_t m_max_index;

		ISlice(std::shared_ptr<Iterator> iterator,
			size_t start,
			std::optional<size_t> stop,
			size_t step,
			size_t max_index);

	  public:
		// islice(iterable, stop)
		static Result<std::shared_ptr<ISlice>> create(const Value &iterable, const Value &stop);

		// islice(iterable, start, stop[, step]), where None selects the default of a parameter
		static Result<std::shared_ptr<ISlice>>
			create(const Value &iterable, const Value &start, const Value &stop, const Value &step);

		std::string type_name() const override { return "itertools.islice"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
