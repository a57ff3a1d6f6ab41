#include "NativeFunction.hpp"

namespace lazyiter {

NativeFunction::NativeFunction(std::string name, FunctionType &&function)
	: m_name(std::move(name)), m_function(std::move(function))
{}

std::shared_ptr<NativeFunction> NativeFunction::create(std::string name, FunctionType &&function)
{
	return std::shared_ptr<NativeFunction>(new NativeFunction(std::move(name), std::move(function)));
}

std::string NativeFunction::to_string() const
{
	return fmt::format("<built-in function {}>", m_name);
}

Result<Value> NativeFunction::call(const std::vector<Value> &args) { return m_function(args); }

}// namespace lazyiter
