#pragma once

#include "runtime/Object.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {
	class Count : public Iterator
	{
		BigIntType m_current{ 0 };
		const BigIntType m_step{ 1 };
		mutable std::mutex m_mutex;

		Count(BigIntType start, BigIntType step);

	  public:
		static Result<std::shared_ptr<Count>> create();
		static Result<std::shared_ptr<Count>> create(BigIntType start);
		static Result<std::shared_ptr<Count>> create(BigIntType start, BigIntType step);

		std::string type_name() const override { return "itertools.count"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
