#pragma once

#include "runtime/Object.hpp"

namespace lazyiter {
namespace itertools {
	class Compress : public Iterator
	{
		std::shared_ptr<Iterator> m_data;
		std::shared_ptr<Iterator> m_selectors;

		Compress(std::shared_ptr<Iterator> data, std::shared_ptr<Iterator> selectors);

	  public:
		static Result<std::shared_ptr<Compress>> create(const Value &data, const Value &selectors);

		std::string type_name() const override { return "itertools.compress"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
