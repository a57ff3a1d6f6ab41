#pragma once

#include "Object.hpp"

namespace lazyiter {

class Integer : public Object
{
	const BigIntType m_value;

	Integer(BigIntType value);

  public:
	static std::shared_ptr<Integer> create(int64_t value);
	static std::shared_ptr<Integer> create(BigIntType value);

	std::string type_name() const override { return "int"; }
	std::string to_string() const override;

	Result<bool> true_() const override;
	Result<bool> eq(const Value &other) const override;
	Result<Value> add(const Value &other) const override;

	const BigIntType &as_big_int() const { return m_value; }
	int64_t as_i64() const;
	size_t as_size_t() const;
};

}// namespace lazyiter
