#pragma once

#include "Object.hpp"

#include <spdlog/fmt/fmt.h>

namespace lazyiter {

class BaseException : public Object
{
  protected:
	std::string m_message;

	BaseException(std::string message);

  public:
	std::string type_name() const override { return "BaseException"; }
	std::string to_string() const override;

	const std::string &message() const { return m_message; }

	std::string what() const;
};

class Exception : public BaseException
{
  protected:
	Exception(std::string message) : BaseException(std::move(message)) {}

  public:
	std::string type_name() const override { return "Exception"; }
};

}// namespace lazyiter
