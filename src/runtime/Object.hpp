#pragma once

#include "Result.hpp"
#include "forward.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lazyiter {

class Object : public std::enable_shared_from_this<Object>
{
  public:
	virtual ~Object() = default;

	virtual std::string type_name() const = 0;
	virtual std::string to_string() const = 0;

	virtual Result<bool> true_() const;
	virtual Result<bool> eq(const Value &other) const;
	virtual Result<Value> add(const Value &other) const;
	virtual Result<std::shared_ptr<Iterator>> iter();
	virtual Result<Value> call(const std::vector<Value> &args);
};

class Iterator : public Object
{
  public:
	Result<std::shared_ptr<Iterator>> iter() override;

	virtual Result<Value> next() = 0;
};

template<typename T> std::shared_ptr<T> as(const std::shared_ptr<Object> &obj)
{
	return std::dynamic_pointer_cast<T>(obj);
}

}// namespace lazyiter
