#include "List.hpp"
#include "StopIteration.hpp"
#include "Tuple.hpp"
#include "TypeError.hpp"

namespace lazyiter {

List::List(std::vector<Value> &&elements) : m_elements(std::move(elements)) {}

std::shared_ptr<List> List::create() { return create(std::vector<Value>{}); }

std::shared_ptr<List> List::create(std::vector<Value> &&elements)
{
	return std::shared_ptr<List>(new List(std::move(elements)));
}

std::string List::to_string() const { return fmt::format("[{}]", elements_to_string(m_elements)); }

Result<bool> List::true_() const { return Ok(!m_elements.empty()); }

Result<bool> List::eq(const Value &other) const
{
	if (auto other_list = as<List>(other)) {
		return elements_equal(m_elements, other_list->elements());
	}
	return Ok(false);
}

Result<Value> List::add(const Value &other) const
{
	auto other_list = as<List>(other);
	if (!other_list) {
		return Err(
			type_error("can only concatenate list (not \"{}\") to list", other->type_name()));
	}
	std::vector<Value> elements;
	elements.reserve(m_elements.size() + other_list->size());
	elements.insert(elements.end(), m_elements.begin(), m_elements.end());
	elements.insert(elements.end(), other_list->elements().begin(), other_list->elements().end());
	return Ok(List::create(std::move(elements)));
}

Result<std::shared_ptr<Iterator>> List::iter()
{
	return Ok(ListIterator::create(std::static_pointer_cast<const List>(shared_from_this())));
}

ListIterator::ListIterator(std::shared_ptr<const List> list) : m_list(std::move(list)) {}

std::shared_ptr<ListIterator> ListIterator::create(std::shared_ptr<const List> list)
{
	return std::shared_ptr<ListIterator>(new ListIterator(std::move(list)));
}

std::string ListIterator::to_string() const
{
	return fmt::format("<list_iterator at {}>", static_cast<const void *>(this));
}

Result<Value> ListIterator::next()
{
	if (m_current_index >= m_list->size()) { return Err(stop_iteration()); }
	return Ok(m_list->elements()[m_current_index++]);
}

}// namespace lazyiter
