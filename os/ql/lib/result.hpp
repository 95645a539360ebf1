// result.hpp - A Result<T,E> type for error handling
#ifndef QL_LIB_RESULT_HPP
#define QL_LIB_RESULT_HPP

// Result type similar to Rust's Result<T,E>
// Stores either a success value of type T or an error value of type E.
//
// Kernel code only ever carries scalars through a Result (bytes, addresses,
// error enums), so both alternatives are stored side by side instead of in a
// union and the type stays trivially copyable.
template <typename T, typename E = bool> class Result {
private:
  bool success_;
  T value_;
  E error_;

  constexpr Result(bool success, const T &value, const E &error)
      : success_(success), value_(value), error_(error) {}

public:
  // Factory methods for creating Result instances
  static constexpr Result ok(const T &value) { return Result(true, value, E()); }

  static constexpr Result err(const E &error) { return Result(false, T(), error); }

  // Query methods
  constexpr bool is_ok() const { return success_; }
  constexpr bool is_err() const { return !success_; }

  // Value access (meaningless if wrong state)
  constexpr const T &value() const { return value_; }
  constexpr const E &error() const { return error_; }

  // Value access with default
  constexpr T value_or(const T &default_val) const { return success_ ? value_ : default_val; }

  // Ergonomic operators
  constexpr explicit operator bool() const { return success_; }
  constexpr const T &operator*() const { return value_; }
};

// Convenience typedef for simple present/absent results
template <typename T> using BoolResult = Result<T, bool>;

#endif
