/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_RESULT_HPP
#define PERFSCOPE_RESULT_HPP

#include <type_traits>
#include <utility>

#include <boost/variant.hpp>

/*
 * Result is a type which represents value or an error, and values and errors
 * are template parametrized. Working with value wrapped in result is done
 * with hasValue()/assumeValue() pairs, the same for errors.
 */
namespace perfscope::expected {

  template <typename T>
  struct Value {
    T value;
  };

  template <>
  struct Value<void> {};

  template <typename E>
  struct Error {
    E error;
  };

  template <typename V, typename E>
  class Result : public boost::variant<Value<V>, Error<E>> {
    using Base = boost::variant<Value<V>, Error<E>>;

   public:
    using ValueType = Value<V>;
    using ErrorType = Error<E>;

    Result(ValueType value) : Base(std::move(value)) {}
    Result(ErrorType error) : Base(std::move(error)) {}

    template <typename OtherE,
              typename = std::enable_if_t<
                  not std::is_same_v<OtherE, E>
                  and std::is_constructible_v<E, OtherE>>>
    Result(Error<OtherE> error)
        : Base(ErrorType{E(std::move(error.error))}) {}

    bool hasValue() const {
      return boost::get<ValueType>(&base()) != nullptr;
    }

    bool hasError() const {
      return boost::get<ErrorType>(&base()) != nullptr;
    }

    template <typename T = V,
              typename = std::enable_if_t<not std::is_void_v<T>>>
    T const &assumeValue() const & {
      return boost::get<ValueType>(base()).value;
    }

    template <typename T = V,
              typename = std::enable_if_t<not std::is_void_v<T>>>
    T assumeValue() && {
      return std::move(boost::get<ValueType>(base()).value);
    }

    E const &assumeError() const & {
      return boost::get<ErrorType>(base()).error;
    }

    E assumeError() && {
      return std::move(boost::get<ErrorType>(base()).error);
    }

   private:
    Base const &base() const {
      return *this;
    }

    Base &base() {
      return *this;
    }
  };

  template <typename T>
  Value<std::decay_t<T>> makeValue(T &&value) {
    return Value<std::decay_t<T>>{std::forward<T>(value)};
  }

  template <typename E>
  Error<std::decay_t<E>> makeError(E &&error) {
    return Error<std::decay_t<E>>{std::forward<E>(error)};
  }

  template <typename V, typename E>
  bool hasValue(Result<V, E> const &result) {
    return result.hasValue();
  }

  template <typename V, typename E>
  bool hasError(Result<V, E> const &result) {
    return result.hasError();
  }

}  // namespace perfscope::expected

#endif  // PERFSCOPE_RESULT_HPP
