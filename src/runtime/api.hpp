#pragma once

#include "Object.hpp"

namespace lazyiter {

Result<std::shared_ptr<Iterator>> iter(const Value &iterable);

Result<bool> truthy(const Value &value);

Result<bool> equals(const Value &lhs, const Value &rhs);

Result<Value> add(const Value &lhs, const Value &rhs);

Result<Value> call(const Value &callable, const std::vector<Value> &args);

// Drains `iterable` into a vector. Errors other than exhaustion are forwarded.
Result<std::vector<Value>> extract_elements(const Value &iterable);

}// namespace lazyiter
