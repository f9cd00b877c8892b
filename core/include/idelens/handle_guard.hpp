#pragma once
#include <utility>

namespace idelens {

// Scoped owner of an OS handle. Traits supplies
//   using handle_type = ...;
//   static handle_type invalid();
//   void close(handle_type h);          // may use per-instance state
// The handle is closed exactly once: on destruction or the first reset().
// There is no release(); ownership never leaves the guard.
template <typename Traits> class UniqueHandle {
public:
  using handle_type = typename Traits::handle_type;

  UniqueHandle() : h_(Traits::invalid()) {}
  explicit UniqueHandle(handle_type h, Traits traits = Traits())
      : h_(h), traits_(std::move(traits)) {}
  ~UniqueHandle() { reset(); }

  UniqueHandle(UniqueHandle &&other) noexcept
      : h_(other.h_), traits_(std::move(other.traits_)) {
    other.h_ = Traits::invalid();
  }
  UniqueHandle &operator=(UniqueHandle &&other) noexcept {
    if (this != &other) {
      reset();
      h_ = other.h_;
      traits_ = std::move(other.traits_);
      other.h_ = Traits::invalid();
    }
    return *this;
  }

  UniqueHandle(const UniqueHandle &) = delete;
  UniqueHandle &operator=(const UniqueHandle &) = delete;

  handle_type get() const { return h_; }
  bool is_valid() const { return h_ != Traits::invalid(); }
  explicit operator bool() const { return is_valid(); }

  void reset() {
    if (is_valid()) {
      handle_type h = h_;
      h_ = Traits::invalid();
      traits_.close(h);
    }
  }

private:
  handle_type h_;
  Traits traits_;
};

// Scoped memory device context. Remembers the object that was selected
// before the first select() and puts it back before the context is
// destroyed. Traits supplies
//   using handle_type = ...;   using object_type = ...;
//   static handle_type invalid();   static object_type invalid_object();
//   object_type select(handle_type dc, object_type obj);  // returns previous
//   void destroy(handle_type dc);
template <typename Traits> class ScopedSelectContext {
public:
  using handle_type = typename Traits::handle_type;
  using object_type = typename Traits::object_type;

  ScopedSelectContext()
      : dc_(Traits::invalid()), previous_(Traits::invalid_object()) {}
  explicit ScopedSelectContext(handle_type dc, Traits traits = Traits())
      : dc_(dc), previous_(Traits::invalid_object()),
        traits_(std::move(traits)) {}
  ~ScopedSelectContext() { reset(); }

  ScopedSelectContext(ScopedSelectContext &&other) noexcept
      : dc_(other.dc_), previous_(other.previous_),
        traits_(std::move(other.traits_)) {
    other.dc_ = Traits::invalid();
    other.previous_ = Traits::invalid_object();
  }
  ScopedSelectContext &operator=(ScopedSelectContext &&other) noexcept {
    if (this != &other) {
      reset();
      dc_ = other.dc_;
      previous_ = other.previous_;
      traits_ = std::move(other.traits_);
      other.dc_ = Traits::invalid();
      other.previous_ = Traits::invalid_object();
    }
    return *this;
  }

  ScopedSelectContext(const ScopedSelectContext &) = delete;
  ScopedSelectContext &operator=(const ScopedSelectContext &) = delete;

  handle_type get() const { return dc_; }
  bool is_valid() const { return dc_ != Traits::invalid(); }
  explicit operator bool() const { return is_valid(); }

  // Returns false when the context is gone or the selection failed.
  bool select(object_type obj) {
    if (!is_valid())
      return false;
    object_type prev = traits_.select(dc_, obj);
    if (prev == Traits::invalid_object())
      return false;
    if (previous_ == Traits::invalid_object())
      previous_ = prev;
    return true;
  }

  void reset() {
    if (!is_valid())
      return;
    handle_type dc = dc_;
    dc_ = Traits::invalid();
    if (previous_ != Traits::invalid_object()) {
      traits_.select(dc, previous_);
      previous_ = Traits::invalid_object();
    }
    traits_.destroy(dc);
  }

private:
  handle_type dc_;
  object_type previous_;
  Traits traits_;
};

} // namespace idelens
