#pragma once

#include "runtime/Object.hpp"

#include <mutex>
#include <optional>

namespace lazyiter {
namespace itertools {
	class Repeat : public Iterator
	{
		Value m_object;
		// std::nullopt repeats forever
		std::optional<size_t> m_times_remaining;
		mutable std::mutex m_mutex;

		Repeat(Value object, std::optional<size_t> times);

	  public:
		static Result<std::shared_ptr<Repeat>> create(Value object);
		static Result<std::shared_ptr<Repeat>> create(Value object, BigIntType times);

		std::string type_name() const override { return "itertools.repeat"; }
		std::string to_string() const override;

		Result<Value> next() override;

		// remaining count, TypeError when unbounded
		Result<size_t> length_hint() const;

		// arguments that recreate this iterator at its current position
		std::vector<Value> reduce() const;
	};
}// namespace itertools
}// namespace lazyiter
