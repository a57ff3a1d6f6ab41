#pragma once

#include "BaseException.hpp"

namespace lazyiter {

class ValueError : public Exception
{
	template<typename... Args>
	friend std::shared_ptr<BaseException> value_error(fmt::format_string<Args...> message,
		Args &&...args);

  private:
	ValueError(std::string message) : Exception(std::move(message)) {}

  public:
	std::string type_name() const override { return "ValueError"; }
};

template<typename... Args>
inline std::shared_ptr<BaseException> value_error(fmt::format_string<Args...> message,
	Args &&...args)
{
	return std::shared_ptr<ValueError>(
		new ValueError(fmt::format(message, std::forward<Args>(args)...)));
}

}// namespace lazyiter
