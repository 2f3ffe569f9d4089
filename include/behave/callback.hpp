#pragma once

#include <type_traits>
#include <utility>

namespace behave {

/**
 * non-owning delegate used for host hooks.
 *
 * an empty callback is valid: invoking it does nothing and returns a
 * value-initialized result, so hooks a host does not care about can stay unset.
 */
template <class Signature>
struct callback;

template <class R, class... Args>
struct callback<R(Args...)> {
  using result_type = R;
  using thunk_fn = R (*)(void *, Args...);

  void * target = nullptr;
  thunk_fn thunk = nullptr;

  constexpr callback() noexcept = default;
  constexpr callback(void * obj, thunk_fn fn) noexcept : target(obj), thunk(fn) {}

  constexpr explicit operator bool() const noexcept { return thunk != nullptr; }

  R operator()(Args... args) const {
    if (thunk == nullptr) {
      if constexpr (std::is_void_v<R>) {
        return;
      } else {
        return R{};
      }
    }
    return thunk(target, std::forward<Args>(args)...);
  }

  // Binds a free function known at compile time.
  template <auto Fn>
  static constexpr callback bind() noexcept {
    return callback{nullptr, [](void *, Args... args) -> R {
                      return Fn(std::forward<Args>(args)...);
                    }};
  }

  // Binds a member function of `obj`; `obj` must outlive the callback.
  template <class T, auto MemFn>
  static constexpr callback bind(T * obj) noexcept {
    return callback{obj, [](void * ptr, Args... args) -> R {
                      return (static_cast<T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
                    }};
  }
};

}  // namespace behave
