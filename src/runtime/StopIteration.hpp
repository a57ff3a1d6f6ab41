#pragma once

#include "BaseException.hpp"

namespace lazyiter {

class StopIteration : public Exception
{
	friend std::shared_ptr<BaseException> stop_iteration();

  private:
	StopIteration() : Exception("") {}

  public:
	std::string type_name() const override { return "StopIteration"; }
};

inline std::shared_ptr<BaseException> stop_iteration()
{
	return std::shared_ptr<StopIteration>(new StopIteration());
}

inline bool is_stop_iteration(const std::shared_ptr<BaseException> &exc)
{
	return std::dynamic_pointer_cast<StopIteration>(exc) != nullptr;
}

}// namespace lazyiter
