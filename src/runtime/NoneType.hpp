#pragma once

#include "Object.hpp"

namespace lazyiter {

class NoneType : public Object
{
	friend std::shared_ptr<NoneType> none();

	NoneType() = default;

  public:
	std::string type_name() const override { return "NoneType"; }
	std::string to_string() const override { return "None"; }

	Result<bool> true_() const override { return Ok(false); }
};

std::shared_ptr<NoneType> none();

}// namespace lazyiter
