#include "Tuple.hpp"
#include "StopIteration.hpp"
#include "TypeError.hpp"

#include <sstream>

namespace lazyiter {

Result<bool> elements_equal(const std::vector<Value> &lhs, const std::vector<Value> &rhs)
{
	if (lhs.size() != rhs.size()) { return Ok(false); }
	for (size_t i = 0; i < lhs.size(); ++i) {
		if (lhs[i] == rhs[i]) { continue; }
		auto result = lhs[i]->eq(rhs[i]);
		if (result.is_err()) { return result; }
		if (!result.unwrap()) { return Ok(false); }
	}
	return Ok(true);
}

std::string elements_to_string(const std::vector<Value> &elements)
{
	std::ostringstream os;
	if (!elements.empty()) {
		auto it = elements.begin();
		while (std::next(it) != elements.end()) {
			os << (*it)->to_string() << ", ";
			std::advance(it, 1);
		}
		os << (*it)->to_string();
	}
	return os.str();
}

Tuple::Tuple(std::vector<Value> &&elements) : m_elements(std::move(elements)) {}

std::shared_ptr<Tuple> Tuple::create() { return create(std::vector<Value>{}); }

std::shared_ptr<Tuple> Tuple::create(std::vector<Value> &&elements)
{
	return std::shared_ptr<Tuple>(new Tuple(std::move(elements)));
}

std::string Tuple::to_string() const
{
	std::ostringstream os;
	os << "(" << elements_to_string(m_elements);
	if (m_elements.size() == 1) { os << ','; }
	os << ")";
	return os.str();
}

Result<bool> Tuple::true_() const { return Ok(!m_elements.empty()); }

Result<bool> Tuple::eq(const Value &other) const
{
	if (auto other_tuple = as<Tuple>(other)) {
		return elements_equal(m_elements, other_tuple->elements());
	}
	return Ok(false);
}

Result<Value> Tuple::add(const Value &other) const
{
	auto other_tuple = as<Tuple>(other);
	if (!other_tuple) {
		return Err(type_error(
			"can only concatenate tuple (not \"{}\") to tuple", other->type_name()));
	}
	std::vector<Value> elements;
	elements.reserve(m_elements.size() + other_tuple->size());
	elements.insert(elements.end(), m_elements.begin(), m_elements.end());
	elements.insert(elements.end(), other_tuple->elements().begin(), other_tuple->elements().end());
	return Ok(Tuple::create(std::move(elements)));
}

Result<std::shared_ptr<Iterator>> Tuple::iter()
{
	return Ok(TupleIterator::create(std::static_pointer_cast<const Tuple>(shared_from_this())));
}

TupleIterator::TupleIterator(std::shared_ptr<const Tuple> tuple) : m_tuple(std::move(tuple)) {}

std::shared_ptr<TupleIterator> TupleIterator::create(std::shared_ptr<const Tuple> tuple)
{
	return std::shared_ptr<TupleIterator>(new TupleIterator(std::move(tuple)));
}

std::string TupleIterator::to_string() const
{
	return fmt::format("<tuple_iterator at {}>", static_cast<const void *>(this));
}

Result<Value> TupleIterator::next()
{
	if (m_current_index >= m_tuple->size()) { return Err(stop_iteration()); }
	return Ok((*m_tuple)[m_current_index++]);
}

}// namespace lazyiter
