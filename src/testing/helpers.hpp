#pragma once

#include "runtime/Integer.hpp"
#include "runtime/List.hpp"
#include "runtime/NativeFunction.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/String.hpp"
#include "runtime/ValueError.hpp"
#include "runtime/api.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <initializer_list>

namespace lazyiter {
namespace test {

	inline std::shared_ptr<List> int_list(std::initializer_list<int64_t> values)
	{
		std::vector<Value> elements;
		for (const auto &v : values) { elements.push_back(Integer::create(v)); }
		return List::create(std::move(elements));
	}

	inline std::shared_ptr<String> str(std::string value) { return String::create(std::move(value)); }

	// Drains `iterator`, failing the current test if anything other than exhaustion is returned.
	inline std::vector<Value> collect(const std::shared_ptr<Iterator> &iterator)
	{
		std::vector<Value> result;
		auto value = iterator->next();
		while (value.is_ok()) {
			result.push_back(value.unwrap());
			value = iterator->next();
		}
		EXPECT_TRUE(is_stop_iteration(value.unwrap_err())) << value.unwrap_err()->what();
		return result;
	}

	inline std::vector<Value> take(const std::shared_ptr<Iterator> &iterator, size_t n)
	{
		std::vector<Value> result;
		for (size_t i = 0; i < n; ++i) {
			auto value = iterator->next();
			EXPECT_TRUE(value.is_ok());
			if (value.is_err()) { break; }
			result.push_back(value.unwrap());
		}
		return result;
	}

	inline std::vector<int64_t> to_ints(const std::vector<Value> &values)
	{
		std::vector<int64_t> result;
		for (const auto &v : values) {
			auto i = as<Integer>(v);
			EXPECT_TRUE(i) << v->to_string();
			if (i) { result.push_back(i->as_i64()); }
		}
		return result;
	}

	// Python style representation of a sequence of values, e.g. "[(1, 2), (3, 4)]"
	inline std::string repr(const std::vector<Value> &values)
	{
		return List::create(std::vector<Value>(values))->to_string();
	}

	inline bool is_exhausted(const std::shared_ptr<Iterator> &iterator)
	{
		auto value = iterator->next();
		return value.is_err() && is_stop_iteration(value.unwrap_err());
	}

	inline std::shared_ptr<NativeFunction> function(std::string name,
		NativeFunction::FunctionType &&function)
	{
		return NativeFunction::create(std::move(name), std::move(function));
	}

	// Yields 0, 1, ... up to `size` while counting how many values were pulled.
	// With `fail_at` set, pulling that index returns a ValueError instead.
	class CountingIterator : public Iterator
	{
		const int64_t m_size;
		const int64_t m_fail_at;
		std::atomic<int64_t> m_pulled{ 0 };

		CountingIterator(int64_t size, int64_t fail_at) : m_size(size), m_fail_at(fail_at) {}

	  public:
		static std::shared_ptr<CountingIterator> create(int64_t size, int64_t fail_at = -1)
		{
			return std::shared_ptr<CountingIterator>(new CountingIterator(size, fail_at));
		}

		std::string type_name() const override { return "counting_iterator"; }
		std::string to_string() const override { return "<counting_iterator>"; }

		Result<Value> next() override
		{
			const auto index = m_pulled.load();
			if (index >= m_size) { return Err(stop_iteration()); }
			m_pulled.fetch_add(1);
			if (index == m_fail_at) { return Err(value_error("failed at {}", index)); }
			return Ok(Integer::create(index));
		}

		int64_t pulled() const { return m_pulled.load(); }
	};

}// namespace test
}// namespace lazyiter
