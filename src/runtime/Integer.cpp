#include "Integer.hpp"
#include "Bool.hpp"
#include "TypeError.hpp"

namespace lazyiter {

Integer::Integer(BigIntType value) : m_value(std::move(value)) {}

std::shared_ptr<Integer> Integer::create(int64_t value)
{
	return create(BigIntType{ static_cast<signed long>(value) });
}

std::shared_ptr<Integer> Integer::create(BigIntType value)
{
	return std::shared_ptr<Integer>(new Integer(std::move(value)));
}

std::string Integer::to_string() const { return m_value.get_str(); }

Result<bool> Integer::true_() const { return Ok(m_value != 0); }

Result<bool> Integer::eq(const Value &other) const
{
	if (auto other_int = as<Integer>(other)) { return Ok(m_value == other_int->as_big_int()); }
	if (auto other_bool = as<Bool>(other)) {
		return Ok(m_value == (other_bool->value() ? 1 : 0));
	}
	return Ok(false);
}

Result<Value> Integer::add(const Value &other) const
{
	if (auto other_int = as<Integer>(other)) {
		return Ok(Integer::create(BigIntType{ m_value + other_int->as_big_int() }));
	}
	return Err(type_error(
		"unsupported operand type(s) for +: '{}' and '{}'", type_name(), other->type_name()));
}

int64_t Integer::as_i64() const
{
	ASSERT(m_value.fits_slong_p());
	return m_value.get_si();
}

size_t Integer::as_size_t() const
{
	ASSERT(m_value.fits_ulong_p());
	return m_value.get_ui();
}

}// namespace lazyiter
