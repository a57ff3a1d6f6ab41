#include "Tee.hpp"
#include "config.hpp"
#include "runtime/MemoryError.hpp"
#include "runtime/RuntimeError.hpp"
#include "runtime/ValueError.hpp"
#include "runtime/api.hpp"

#include <mutex>
#include <new>

namespace lazyiter {
namespace itertools {

	Result<Value> TeeData::get_item(size_t index)
	{
		{
			std::shared_lock lock{ m_mutex };
			if (index < m_values.size()) { return Ok(m_values[index]); }
		}

		{
			std::unique_lock lock{ m_mutex };
			// another copy may have filled the slot in the meantime
			if (index < m_values.size()) { return Ok(m_values[index]); }
			if (m_running) { return Err(runtime_error("cannot re-enter the tee iterator")); }
			m_running = true;
		}

		auto value = m_iterator->next();

		std::unique_lock lock{ m_mutex };
		m_running = false;
		if (value.is_err()) { return value; }
		m_values.push_back(value.unwrap());
		spdlog::debug("itertools._tee: buffer grew to {} values", m_values.size());
		ASSERT(index < m_values.size());
		return Ok(m_values[index]);
	}

	size_t TeeData::size() const
	{
		std::shared_lock lock{ m_mutex };
		return m_values.size();
	}

	Tee::Tee(std::shared_ptr<TeeData> data, size_t index) : m_data(std::move(data)), m_index(index)
	{}

	Result<std::shared_ptr<Tee>> Tee::create(const Value &iterable)
	{
		auto iterator = lazyiter::iter(iterable);
		if (iterator.is_err()) { return Err(iterator.unwrap_err()); }
		if (auto tee = as<Tee>(iterator.unwrap())) { return Ok(tee->copy()); }
		return Ok(std::shared_ptr<Tee>(new Tee(std::make_shared<TeeData>(iterator.unwrap()), 0)));
	}

	std::string Tee::to_string() const
	{
		return fmt::format("<itertools._tee object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Tee::next()
	{
		auto value = m_data->get_item(m_index.load());
		if (value.is_err()) { return value; }
		m_index.fetch_add(1);
		return value;
	}

	std::shared_ptr<Tee> Tee::copy() const
	{
		return std::shared_ptr<Tee>(new Tee(m_data, m_index.load()));
	}

	Result<std::vector<std::shared_ptr<Tee>>> tee(const Value &iterable)
	{
		return tee(iterable, BigIntType{ static_cast<unsigned long>(Config::the().default_tee_copies) });
	}

	Result<std::vector<std::shared_ptr<Tee>>> tee(const Value &iterable, const BigIntType &n)
	{
		if (n < 0) { return Err(value_error("n must be >= 0")); }
		if (n > Config::the().max_index) { return Err(value_error("n must be <= sys.maxsize")); }

		auto first = Tee::create(iterable);
		if (first.is_err()) { return Err(first.unwrap_err()); }

		std::vector<std::shared_ptr<Tee>> copies;
		if (n > copies.max_size()) {
			return Err(memory_error(allocation_size<std::shared_ptr<Tee>>(n)));
		}
		const auto count = n.get_ui();
		try {
			copies.reserve(count);
			if (count > 0) {
				copies.push_back(first.unwrap());
				for (size_t i = 1; i < count; ++i) { copies.push_back(first.unwrap()->copy()); }
			}
		} catch (const std::bad_alloc &) {
			return Err(memory_error(allocation_size<std::shared_ptr<Tee>>(n)));
		}
		spdlog::trace("itertools.tee: created {} copies", count);
		return Ok(std::move(copies));
	}

}// namespace itertools
}// namespace lazyiter
