#pragma once

#include <gmpxx.h>

#include <memory>

namespace lazyiter {

class Object;
class BaseException;

using Value = std::shared_ptr<Object>;
using BigIntType = mpz_class;

template<typename T> class Result;

}// namespace lazyiter
