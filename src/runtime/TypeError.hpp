#pragma once

#include "BaseException.hpp"

namespace lazyiter {

class TypeError : public Exception
{
	template<typename... Args>
	friend std::shared_ptr<BaseException> type_error(fmt::format_string<Args...> message,
		Args &&...args);

  private:
	TypeError(std::string message) : Exception(std::move(message)) {}

  public:
	std::string type_name() const override { return "TypeError"; }
};

template<typename... Args>
inline std::shared_ptr<BaseException> type_error(fmt::format_string<Args...> message,
	Args &&...args)
{
	return std::shared_ptr<TypeError>(
		new TypeError(fmt::format(message, std::forward<Args>(args)...)));
}

}// namespace lazyiter
