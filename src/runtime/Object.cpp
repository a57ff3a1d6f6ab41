#include "Object.hpp"
#include "TypeError.hpp"

namespace lazyiter {

Result<bool> Object::true_() const { return Ok(true); }

Result<bool> Object::eq(const Value &other) const { return Ok(this == other.get()); }

Result<Value> Object::add(const Value &other) const
{
	return Err(type_error("unsupported operand type(s) for +: '{}' and '{}'",
		type_name(),
		other->type_name()));
}

Result<std::shared_ptr<Iterator>> Object::iter()
{
	return Err(type_error("'{}' object is not iterable", type_name()));
}

Result<Value> Object::call(const std::vector<Value> &)
{
	return Err(type_error("'{}' object is not callable", type_name()));
}

Result<std::shared_ptr<Iterator>> Iterator::iter()
{
	return Ok(std::static_pointer_cast<Iterator>(shared_from_this()));
}

}// namespace lazyiter
