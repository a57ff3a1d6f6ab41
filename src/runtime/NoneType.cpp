#include "NoneType.hpp"

namespace lazyiter {

std::shared_ptr<NoneType> none()
{
	static std::shared_ptr<NoneType> s_none{ new NoneType() };
	return s_none;
}

}// namespace lazyiter
