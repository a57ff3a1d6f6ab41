#pragma once

#include "../forward.hpp"
#include "../utilities.hpp"

#include <memory>
#include <type_traits>
#include <variant>

namespace lazyiter {

template<typename T> struct Ok
{
	T value;
	constexpr Ok(T value_) : value(std::move(value_)) {}
};

template<typename T> Ok(T) -> Ok<T>;

struct Err
{
	std::shared_ptr<BaseException> exc;
	Err(std::shared_ptr<BaseException> value_) : exc(std::move(value_)) {}
};

namespace detail {
	template<typename> struct is_ok : std::false_type
	{
	};

	template<typename T> struct is_ok<Ok<T>> : std::true_type
	{
		using type = T;
	};

	template<typename> struct is_result : std::false_type
	{
	};

	template<typename T> struct is_result<Result<T>> : std::true_type
	{
		using type = T;
	};
}// namespace detail

template<typename T> class Result
{
  public:
	using OkType = T;
	using ErrType = std::shared_ptr<BaseException>;
	using StorageType = std::variant<Ok<T>, Err>;

  private:
	StorageType result;

  public:
	Result(Ok<T> result_) : result(std::move(result_)) {}
	template<typename U> Result(Ok<U> result_) : result(Ok<T>(std::move(result_.value)))
	{
		static_assert(std::is_convertible_v<U, T>);
	}
	Result(Err result_) : result(std::move(result_)) {}

	template<typename U> Result(const Result<U> &other) : result(Err(nullptr))
	{
		static_assert(std::is_convertible_v<U, T>);
		if (other.is_ok()) {
			result = Ok<T>(other.unwrap());
		} else {
			result = Err(other.unwrap_err());
		}
	}

	bool is_ok() const { return std::holds_alternative<Ok<T>>(result); }
	bool is_err() const { return !is_ok(); }

	T unwrap() const
	{
		ASSERT(is_ok());
		return std::get<Ok<T>>(result).value;
	}

	ErrType unwrap_err() const
	{
		ASSERT(is_err());
		return std::get<Err>(result).exc;
	}

	template<typename FunctorType,
		typename ResultType =
			std::conditional_t<detail::is_ok<typename std::invoke_result_t<FunctorType, T>>{},
				typename detail::is_ok<typename std::invoke_result_t<FunctorType, T>>::type,
				typename detail::is_result<typename std::invoke_result_t<FunctorType, T>>::type>>
	Result<ResultType> and_then(FunctorType &&op) const;

	template<typename FunctorType> Result<T> or_else(FunctorType &&op) const;
};

template<typename T>
template<typename FunctorType, typename ResultType>
Result<ResultType> Result<T>::and_then(FunctorType &&op) const
{
	using InvokeResultType = typename std::invoke_result_t<FunctorType, T>;
	static_assert(detail::is_ok<InvokeResultType>{} || detail::is_result<InvokeResultType>{},
		"Return type of function must be of type Ok<U> or Result<U>");
	if (is_ok()) {
		return op(unwrap());
	} else {
		return Result<ResultType>(Err(unwrap_err()));
	}
}

template<typename T>
template<typename FunctorType>
Result<T> Result<T>::or_else(FunctorType &&op) const
{
	using InvokeResultType = typename std::invoke_result_t<FunctorType, ErrType>;
	static_assert(detail::is_ok<InvokeResultType>{} || detail::is_result<InvokeResultType>{},
		"Return type of function must be of type Ok<U> or Result<U>");
	if (is_err()) {
		return op(unwrap_err());
	} else {
		return Result<T>(Ok(unwrap()));
	}
}

}// namespace lazyiter
