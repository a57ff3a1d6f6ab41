#pragma once

#include "runtime/Object.hpp"

#include <mutex>

namespace lazyiter {
namespace itertools {
	class Grouper;

	class GroupBy : public Iterator
	{
		friend class Grouper;

		struct State
		{
			Value current_value;
			Value current_key;
			// set when a grouper already pulled the first value of the next group
			bool next_group{ false };
			std::weak_ptr<Grouper> grouper;

			bool is_current(const Grouper *grouper) const;
		};

		std::shared_ptr<Iterator> m_iterator;
		Value m_key_function;
		State m_state;
		std::mutex m_mutex;

		GroupBy(std::shared_ptr<Iterator> iterator, Value key_function);

		// Pulls one value from the source and computes its key.
		Result<std::pair<Value, Value>> advance();

	  public:
		static Result<std::shared_ptr<GroupBy>> create(const Value &iterable,
			Value key_function = nullptr);

		std::string type_name() const override { return "itertools.groupby"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};

	class Grouper : public Iterator
	{
		friend class GroupBy;

		std::shared_ptr<GroupBy> m_groupby;

		explicit Grouper(std::shared_ptr<GroupBy> groupby);

	  public:
		std::string type_name() const override { return "itertools._grouper"; }
		std::string to_string() const override;

		Result<Value> next() override;
	};
}// namespace itertools
}// namespace lazyiter
