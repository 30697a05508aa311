#ifndef POS_SIM_RESULT_OR_ERROR_HPP
#define POS_SIM_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pos {

/**
 * Common base for module error types: a numeric code plus a message.
 * Modules derive their own Error from it so codes stay scoped per module.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

inline std::ostream &operator<<(std::ostream &os, const RoeErrorBase &err) {
  return os << "[" << err.code << "] " << err.message;
}

/**
 * Holds either a value of T or an error of E.
 * Both alternatives convert implicitly, so functions can simply
 * `return value;` or `return Error(code, "message");`.
 */
template <typename T, typename E> class ResultOrError {
public:
  ResultOrError(const T &value) : hasValue_(true) { new (&storage_) T(value); }
  ResultOrError(T &&value) : hasValue_(true) { new (&storage_) T(std::move(value)); }
  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }
  ResultOrError(E &&err) : hasValue_(false) { new (&storage_) E(std::move(err)); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    copyFrom(other);
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    moveFrom(std::move(other));
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      copyFrom(other);
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      moveFrom(std::move(other));
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const T &value() const {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return *reinterpret_cast<const T *>(&storage_);
  }

  T &value() {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return *reinterpret_cast<T *>(&storage_);
  }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *reinterpret_cast<const E *>(&storage_);
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  void copyFrom(const ResultOrError &other) {
    if (hasValue_) {
      new (&storage_) T(*reinterpret_cast<const T *>(&other.storage_));
    } else {
      new (&storage_) E(*reinterpret_cast<const E *>(&other.storage_));
    }
  }

  void moveFrom(ResultOrError &&other) {
    if (hasValue_) {
      new (&storage_) T(std::move(*reinterpret_cast<T *>(&other.storage_)));
    } else {
      new (&storage_) E(std::move(*reinterpret_cast<E *>(&other.storage_)));
    }
  }

  void destroy() {
    if (hasValue_) {
      reinterpret_cast<T *>(&storage_)->~T();
    } else {
      reinterpret_cast<E *>(&storage_)->~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, T, E>::type storage_;
};

// Success carries no value
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}
  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

private:
  bool hasValue_;
  E error_;
};

} // namespace pos

#endif // POS_SIM_RESULT_OR_ERROR_HPP
