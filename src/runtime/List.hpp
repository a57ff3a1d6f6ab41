#pragma once

#include "Object.hpp"

namespace lazyiter {

class List : public Object
{
	std::vector<Value> m_elements;

	List(std::vector<Value> &&elements);

  public:
	static std::shared_ptr<List> create();
	static std::shared_ptr<List> create(std::vector<Value> &&elements);

	std::string type_name() const override { return "list"; }
	std::string to_string() const override;

	Result<bool> true_() const override;
	Result<bool> eq(const Value &other) const override;
	Result<Value> add(const Value &other) const override;
	Result<std::shared_ptr<Iterator>> iter() override;

	std::vector<Value> &elements() { return m_elements; }
	const std::vector<Value> &elements() const { return m_elements; }
	size_t size() const { return m_elements.size(); }

	void append(Value value) { m_elements.push_back(std::move(value)); }
};

class ListIterator : public Iterator
{
	std::shared_ptr<const List> m_list;
	size_t m_current_index{ 0 };

	ListIterator(std::shared_ptr<const List> list);

  public:
	static std::shared_ptr<ListIterator> create(std::shared_ptr<const List> list);

	std::string type_name() const override { return "list_iterator"; }
	std::string to_string() const override;

	Result<Value> next() override;
};

}// namespace lazyiter
