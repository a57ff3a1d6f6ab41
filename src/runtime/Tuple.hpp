#pragma once

#include "Object.hpp"

namespace lazyiter {

class Tuple : public Object
{
	const std::vector<Value> m_elements;

	Tuple(std::vector<Value> &&elements);

  public:
	static std::shared_ptr<Tuple> create();
	static std::shared_ptr<Tuple> create(std::vector<Value> &&elements);
	template<typename... Args> static std::shared_ptr<Tuple> create(Args &&...args)
	{
		return Tuple::create(std::vector<Value>{ std::forward<Args>(args)... });
	}

	std::string type_name() const override { return "tuple"; }
	std::string to_string() const override;

	Result<bool> true_() const override;
	Result<bool> eq(const Value &other) const override;
	Result<Value> add(const Value &other) const override;
	Result<std::shared_ptr<Iterator>> iter() override;

	const std::vector<Value> &elements() const { return m_elements; }
	size_t size() const { return m_elements.size(); }
	const Value &operator[](size_t idx) const { return m_elements[idx]; }
};

class TupleIterator : public Iterator
{
	std::shared_ptr<const Tuple> m_tuple;
	size_t m_current_index{ 0 };

	TupleIterator(std::shared_ptr<const Tuple> tuple);

  public:
	static std::shared_ptr<TupleIterator> create(std::shared_ptr<const Tuple> tuple);

	std::string type_name() const override { return "tuple_iterator"; }
	std::string to_string() const override;

	Result<Value> next() override;
};

Result<bool> elements_equal(const std::vector<Value> &lhs, const std::vector<Value> &rhs);

std::string elements_to_string(const std::vector<Value> &elements);

}// namespace lazyiter
