#pragma once

#include "Object.hpp"

namespace lazyiter {

class String : public Object
{
	const std::string m_value;

	String(std::string value);

  public:
	static std::shared_ptr<String> create(std::string value);

	std::string type_name() const override { return "str"; }
	std::string to_string() const override;

	Result<bool> true_() const override;
	Result<bool> eq(const Value &other) const override;
	Result<Value> add(const Value &other) const override;
	Result<std::shared_ptr<Iterator>> iter() override;

	const std::string &value() const { return m_value; }
	size_t size() const { return m_value.size(); }
};

class StringIterator : public Iterator
{
	std::shared_ptr<const String> m_string;
	size_t m_current_index{ 0 };

	StringIterator(std::shared_ptr<const String> string);

  public:
	static std::shared_ptr<StringIterator> create(std::shared_ptr<const String> string);

	std::string type_name() const override { return "str_iterator"; }
	std::string to_string() const override;

	Result<Value> next() override;
};

}// namespace lazyiter
