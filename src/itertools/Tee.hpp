#pragma once

#include "runtime/Object.hpp"

#include <atomic>
#include <shared_mutex>

namespace lazyiter {
namespace itertools {
	// Buffer shared by all copies of a tee. Holds every value pulled from the source so far.
	class TeeData
	{
		std::shared_ptr<Iterator> m_iterator;
		std::vector<Value> m_values;
		bool m_running{ false };
		mutable std::shared_mutex m_mutex;

	  public:
		explicit TeeData(std::shared_ptr<Iterator> iterator) : m_iterator(std::move(iterator)) {}

		// Returns the value at `index`, pulling from the source when index is one past the buffer.
		Result<Value> get_item(size_t index);

		size_t size() const;
	};

	class Tee : public Iterator
	{
		std::shared_ptr<TeeData> m_data;
		std::atomic<size_t> m_index{ 0 };

		Tee(std::shared_ptr<TeeData> data, size_t index);

	  public:
		static Result<std::shared_ptr<Tee>> create(const Value &iterable);

		std::string type_name() const override { return "itertools._tee"; }
		std::string to_string() const override;

		Result<Value> next() override;

		// A new Tee sharing the buffer and starting at this Tee's current position.
		std::shared_ptr<Tee> copy() const;

		const std::shared_ptr<TeeData> &data() const { return m_data; }
	};

	// tee(iterable, n=2)
	Result<std::vector<std::shared_ptr<Tee>>> tee(const Value &iterable);
	Result<std::vector<std::shared_ptr<Tee>>> tee(const Value &iterable, const BigIntType &n);
}// namespace itertools
}// namespace lazyiter
