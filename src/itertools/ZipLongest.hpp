#pragma once

#include "runtime/Object.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {
	class ZipLongest : public Iterator
	{
		// exhausted iterators are reset to nullptr and contribute m_fillvalue
		std::vector<std::shared_ptr<Iterator>> m_iterators;
		const Value m_fillvalue;
		size_t m_active;
		std::mutex m_mutex;

		ZipLongest(std::vector<std::shared_ptr<Iterator>> iterators, Value fillvalue);

	  public:
		// zip_longest(*iterables, fillvalue=None)
		static Result<std::shared_ptr<ZipLongest>> create(const std::vector<Value> &iterables,
			Value fillvalue = nullptr);

		std::string type_name() const override { return "itertools.zip_longest"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
