#include "GroupBy.hpp"
#include "runtime/NoneType.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/Tuple.hpp"
#include "runtime/api.hpp"

#include <utility>

namespace lazyiter {
namespace itertools {

	bool GroupBy::State::is_current(const Grouper *grouper_) const
	{
		auto current = grouper.lock();
		return current && current.get() == grouper_;
	}

	GroupBy::GroupBy(std::shared_ptr<Iterator> iterator, Value key_function)
		: m_iterator(std::move(iterator)), m_key_function(std::move(key_function))
	{}

	Result<std::shared_ptr<GroupBy>> GroupBy::create(const Value &iterable, Value key_function)
	{
		if (key_function == none()) { key_function = nullptr; }
		auto iterator = lazyiter::iter(iterable);
		if (iterator.is_err()) { return Err(iterator.unwrap_err()); }
		spdlog::trace("itertools.groupby: created with {}",
			key_function ? key_function->to_string() : "identity key");
		return Ok(
			std::shared_ptr<GroupBy>(new GroupBy(iterator.unwrap(), std::move(key_function))));
	}

	std::string GroupBy::to_string() const
	{
		return fmt::format("<itertools.groupby object at {}>", static_cast<const void *>(this));
	}

	Result<std::pair<Value, Value>> GroupBy::advance()
	{
		auto value = m_iterator->next();
		if (value.is_err()) { return Err(value.unwrap_err()); }
		if (!m_key_function) { return Ok(std::make_pair(value.unwrap(), value.unwrap())); }

		auto key = lazyiter::call(m_key_function, { value.unwrap() });
		if (key.is_err()) { return Err(key.unwrap_err()); }
		return Ok(std::make_pair(value.unwrap(), key.unwrap()));
	}

	Result<Value> GroupBy::next()
	{
		std::unique_lock lock{ m_mutex };
		m_state.grouper.reset();

		if (!m_state.next_group) {
			auto current_key = m_state.current_key;
			lock.unlock();

			std::pair<Value, Value> value_and_key;
			if (current_key) {
				// skip whatever is left of the current group
				while (true) {
					auto advanced = advance();
					if (advanced.is_err()) { return Err(advanced.unwrap_err()); }
					auto same = equals(advanced.unwrap().second, current_key);
					if (same.is_err()) { return Err(same.unwrap_err()); }
					if (!same.unwrap()) {
						value_and_key = advanced.unwrap();
						break;
					}
				}
			} else {
				auto advanced = advance();
				if (advanced.is_err()) { return Err(advanced.unwrap_err()); }
				value_and_key = advanced.unwrap();
			}

			lock.lock();
			m_state.current_value = std::move(value_and_key.first);
			m_state.current_key = std::move(value_and_key.second);
		}

		m_state.next_group = false;

		auto grouper = std::shared_ptr<Grouper>(
			new Grouper(std::static_pointer_cast<GroupBy>(shared_from_this())));
		m_state.grouper = grouper;
		spdlog::debug("itertools.groupby: new group with key {}", m_state.current_key->to_string());
		return Ok(Tuple::create(m_state.current_key, grouper));
	}

	Grouper::Grouper(std::shared_ptr<GroupBy> groupby) : m_groupby(std::move(groupby)) {}

	std::string Grouper::to_string() const
	{
		return fmt::format("<itertools._grouper object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Grouper::next()
	{
		Value old_key;
		{
			std::unique_lock lock{ m_groupby->m_mutex };
			auto &state = m_groupby->m_state;
			if (!state.is_current(this)) { return Err(stop_iteration()); }

			// the first value of the group was already pulled by the groupby
			if (state.current_value) { return Ok(std::exchange(state.current_value, nullptr)); }

			old_key = state.current_key;
		}

		auto advanced = m_groupby->advance();
		if (advanced.is_err()) { return Err(advanced.unwrap_err()); }
		auto [value, key] = advanced.unwrap();

		auto same = equals(key, old_key);
		if (same.is_err()) { return Err(same.unwrap_err()); }
		if (same.unwrap()) { return Ok(value); }

		std::unique_lock lock{ m_groupby->m_mutex };
		auto &state = m_groupby->m_state;
		state.current_value = std::move(value);
		state.current_key = std::move(key);
		state.next_group = true;
		state.grouper.reset();
		return Err(stop_iteration());
	}

}// namespace itertools
}// namespace lazyiter
