#pragma once

//! Declare an option field with a chainable setter and const/non-const getters
#define ADD_ARG(T, name)                                           \
 public:                                                           \
  inline auto name(const T& new_##name) -> decltype(*this) {       \
    this->name##_ = new_##name;                                    \
    return *this;                                                  \
  }                                                                \
  inline const T& name() const noexcept { return this->name##_; }  \
  inline T& name() noexcept { return this->name##_; }              \
                                                                   \
 private:                                                          \
  T name##_
