#pragma once

#include "Object.hpp"

namespace lazyiter {

class Bool : public Object
{
	friend std::shared_ptr<Bool> true_value();
	friend std::shared_ptr<Bool> false_value();

	const bool m_value;

	Bool(bool value) : m_value(value) {}

  public:
	std::string type_name() const override { return "bool"; }
	std::string to_string() const override { return m_value ? "True" : "False"; }

	Result<bool> true_() const override { return Ok(m_value); }

	bool value() const { return m_value; }
};

std::shared_ptr<Bool> true_value();
std::shared_ptr<Bool> false_value();

inline std::shared_ptr<Bool> bool_value(bool value) { return value ? true_value() : false_value(); }

}// namespace lazyiter
