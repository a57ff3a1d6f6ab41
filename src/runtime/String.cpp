#include "String.hpp"
#include "StopIteration.hpp"
#include "TypeError.hpp"

namespace lazyiter {

String::String(std::string value) : m_value(std::move(value)) {}

std::shared_ptr<String> String::create(std::string value)
{
	return std::shared_ptr<String>(new String(std::move(value)));
}

std::string String::to_string() const { return fmt::format("'{}'", m_value); }

Result<bool> String::true_() const { return Ok(!m_value.empty()); }

Result<bool> String::eq(const Value &other) const
{
	if (auto other_str = as<String>(other)) { return Ok(m_value == other_str->value()); }
	return Ok(false);
}

Result<Value> String::add(const Value &other) const
{
	if (auto other_str = as<String>(other)) {
		return Ok(String::create(m_value + other_str->value()));
	}
	return Err(type_error(
		"can only concatenate str (not \"{}\") to str", other->type_name()));
}

Result<std::shared_ptr<Iterator>> String::iter()
{
	return Ok(StringIterator::create(std::static_pointer_cast<const String>(shared_from_this())));
}

StringIterator::StringIterator(std::shared_ptr<const String> string) : m_string(std::move(string))
{}

std::shared_ptr<StringIterator> StringIterator::create(std::shared_ptr<const String> string)
{
	return std::shared_ptr<StringIterator>(new StringIterator(std::move(string)));
}

std::string StringIterator::to_string() const
{
	return fmt::format("<str_iterator at {}>", static_cast<const void *>(this));
}

Result<Value> StringIterator::next()
{
	if (m_current_index >= m_string->size()) { return Err(stop_iteration()); }
	return Ok(String::create(std::string(1, m_string->value()[m_current_index++])));
}

}// namespace lazyiter
