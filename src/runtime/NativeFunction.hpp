#pragma once

#include "Object.hpp"

#include <functional>

namespace lazyiter {

class NativeFunction : public Object
{
  public:
	using FunctionType = std::function<Result<Value>(const std::vector<Value> &)>;

  private:
	const std::string m_name;
	FunctionType m_function;

	NativeFunction(std::string name, FunctionType &&function);

  public:
	static std::shared_ptr<NativeFunction> create(std::string name, FunctionType &&function);

	std::string type_name() const override { return "builtin_function_or_method"; }
	std::string to_string() const override;

	Result<Value> call(const std::vector<Value> &args) override;

	const std::string &name() const { return m_name; }
};

}// namespace lazyiter
