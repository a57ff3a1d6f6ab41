#include "api.hpp"
#include "StopIteration.hpp"

namespace lazyiter {

Result<std::shared_ptr<Iterator>> iter(const Value &iterable)
{
	ASSERT(iterable);
	return iterable->iter();
}

Result<bool> truthy(const Value &value)
{
	ASSERT(value);
	return value->true_();
}

Result<bool> equals(const Value &lhs, const Value &rhs)
{
	ASSERT(lhs && rhs);
	if (lhs == rhs) { return Ok(true); }
	return lhs->eq(rhs);
}

Result<Value> add(const Value &lhs, const Value &rhs)
{
	ASSERT(lhs && rhs);
	return lhs->add(rhs);
}

Result<Value> call(const Value &callable, const std::vector<Value> &args)
{
	ASSERT(callable);
	return callable->call(args);
}

Result<std::vector<Value>> extract_elements(const Value &iterable)
{
	auto iterator = iter(iterable);
	if (iterator.is_err()) { return Err(iterator.unwrap_err()); }

	std::vector<Value> elements;
	auto value = iterator.unwrap()->next();
	while (value.is_ok()) {
		elements.push_back(value.unwrap());
		value = iterator.unwrap()->next();
	}
	if (!is_stop_iteration(value.unwrap_err())) { return Err(value.unwrap_err()); }
	return Ok(std::move(elements));
}

}// namespace lazyiter
