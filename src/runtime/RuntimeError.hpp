#pragma once

#include "BaseException.hpp"

namespace lazyiter {

class RuntimeError : public Exception
{
	template<typename... Args>
	friend std::shared_ptr<BaseException> runtime_error(fmt::format_string<Args...> message,
		Args &&...args);

  private:
	RuntimeError(std::string message) : Exception(std::move(message)) {}

  public:
	std::string type_name() const override { return "RuntimeError"; }
};

template<typename... Args>
inline std::shared_ptr<BaseException> runtime_error(fmt::format_string<Args...> message,
	Args &&...args)
{
	return std::shared_ptr<RuntimeError>(
		new RuntimeError(fmt::format(message, std::forward<Args>(args)...)));
}

}// namespace lazyiter
