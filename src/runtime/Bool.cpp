#include "Bool.hpp"

namespace lazyiter {

std::shared_ptr<Bool> true_value()
{
	static std::shared_ptr<Bool> s_true{ new Bool(true) };
	return s_true;
}

std::shared_ptr<Bool> false_value()
{
	static std::shared_ptr<Bool> s_false{ new Bool(false) };
	return s_false;
}

}// namespace lazyiter
