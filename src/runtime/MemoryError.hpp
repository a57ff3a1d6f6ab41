#pragma once

#include "BaseException.hpp"

#include <limits>

namespace lazyiter {

class MemoryError : public Exception
{
	friend std::shared_ptr<BaseException> memory_error(size_t failed_allocation_size);

  private:
	MemoryError(std::string message) : Exception(std::move(message)) {}

  public:
	std::string type_name() const override { return "MemoryError"; }
};

inline std::shared_ptr<BaseException> memory_error(size_t failed_allocation_size)
{
	return std::shared_ptr<MemoryError>(new MemoryError(
		fmt::format("memory allocation failed, allocating {} bytes", failed_allocation_size)));
}

// Bytes needed for `count` objects of type T, saturated to the range of size_t.
template<typename T> size_t allocation_size(const BigIntType &count)
{
	const BigIntType bytes = count * sizeof(T);
	if (!bytes.fits_ulong_p()) { return std::numeric_limits<size_t>::max(); }
	return bytes.get_ui();
}

}// namespace lazyiter
