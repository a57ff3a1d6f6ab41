#pragma once

#include "BaseException.hpp"

namespace lazyiter {

class OverflowError : public Exception
{
	template<typename... Args>
	friend std::shared_ptr<BaseException> overflow_error(fmt::format_string<Args...> message,
		Args &&...args);

  private:
	OverflowError(std::string message) : Exception(std::move(message)) {}

  public:
	std::string type_name() const override { return "OverflowError"; }
};

template<typename... Args>
inline std::shared_ptr<BaseException> overflow_error(fmt::format_string<Args...> message,
	Args &&...args)
{
	return std::shared_ptr<OverflowError>(
		new OverflowError(fmt::format(message, std::forward<Args>(args)...)));
}

}// namespace lazyiter
