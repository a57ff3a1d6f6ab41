#include "BaseException.hpp"

namespace lazyiter {

BaseException::BaseException(std::string message) : m_message(std::move(message)) {}

std::string BaseException::to_string() const
{
	return fmt::format("{}('{}')", type_name(), m_message);
}

std::string BaseException::what() const
{
	if (m_message.empty()) { return type_name(); }
	return fmt::format("{}: {}", type_name(), m_message);
}

}// namespace lazyiter
