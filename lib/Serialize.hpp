#ifndef TALLY_SERIALIZE_HPP
#define TALLY_SERIALIZE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace tally {

using uint128 = unsigned __int128;

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Floating point has no canonical byte form across platforms
template <typename T>
static constexpr bool is_floating_v = std::is_floating_point_v<T>;

// Fixed-width integers up to 64 bits; bool and uint128 have their own rules
template <typename T>
static constexpr bool is_wire_int_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    !std::is_same_v<T, uint128> && sizeof(T) <= sizeof(uint64_t);

// Most significant byte first, independent of host byte order
template <typename T> inline void putBigEndian(T value, uint8_t *out) {
  static_assert(is_wire_int_v<T>, "putBigEndian needs a fixed-width integer");
  using U = std::make_unsigned_t<T>;
  U bits = static_cast<U>(value);
  for (size_t i = 0; i < sizeof(T); ++i) {
    out[sizeof(T) - 1 - i] = static_cast<uint8_t>(bits & 0xFF);
    bits = static_cast<U>(bits >> 8);
  }
}

template <typename T> inline T getBigEndian(const uint8_t *in) {
  static_assert(is_wire_int_v<T>, "getBigEndian needs a fixed-width integer");
  using U = std::make_unsigned_t<T>;
  U bits = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    bits = static_cast<U>(static_cast<U>(bits << 8) | in[i]);
  }
  return static_cast<T>(bits);
}

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs.
 *
 * Wire rules:
 *   - integers: fixed width, big endian (uint128 as high then low uint64)
 *   - bool: one byte, 0 or 1
 *   - string, vector: uint64 element count, then the elements
 *   - std::array<uint8_t, N>: N raw bytes, no prefix
 *   - optional: one-byte presence flag, then the value if present
 * The output is therefore a pure function of the values written.
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  void write(bool value) { writeInt(static_cast<uint8_t>(value ? 1 : 0)); }

  template <typename T>
  std::enable_if_t<detail::is_wire_int_v<T>> write(T value) {
    writeInt(value);
  }

  void write(uint128 value) {
    writeInt(static_cast<uint64_t>(value >> 64));
    writeInt(static_cast<uint64_t>(value));
  }

  void write(const std::string &value) {
    writeInt(static_cast<uint64_t>(value.size()));
    os_.write(value.data(), static_cast<std::streamsize>(value.size()));
  }

  template <typename T> void write(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    static_assert(!detail::is_floating_v<T>,
                  "Archive does not support floating point");
    writeInt(static_cast<uint64_t>(value.size()));
    for (const auto &item : value) {
      (*this) & item;
    }
  }

  template <typename T, size_t N> void write(const std::array<T, N> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    static_assert(!detail::is_floating_v<T>,
                  "Archive does not support floating point");
    if constexpr (std::is_same_v<T, uint8_t>) {
      os_.write(reinterpret_cast<const char *>(value.data()), N);
    } else {
      for (const auto &item : value) {
        (*this) & item;
      }
    }
  }

  template <typename T> void write(const std::optional<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    write(value.has_value());
    if (value) {
      (*this) & *value;
    }
  }

  OutputArchive &operator&(bool value) {
    write(value);
    return *this;
  }

  template <typename T>
  std::enable_if_t<detail::is_wire_int_v<T>, OutputArchive &> operator&(T value) {
    writeInt(value);
    return *this;
  }

  OutputArchive &operator&(uint128 value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    write(value);
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    write(value);
    return *this;
  }

  template <typename T, size_t N>
  OutputArchive &operator&(const std::array<T, N> &value) {
    write(value);
    return *this;
  }

  template <typename T>
  OutputArchive &operator&(const std::optional<T> &value) {
    write(value);
    return *this;
  }

  // Operator & for custom types (const reference)
  // Uses const_cast because serialize() is non-const but we're reading (not
  // modifying)
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    const_cast<T &>(value).template serialize<OutputArchive>(*this);
    return *this;
  }

private:
  template <typename T> void writeInt(T value) {
    uint8_t bytes[sizeof(T)];
    detail::putBigEndian(value, bytes);
    os_.write(reinterpret_cast<const char *>(bytes), sizeof(T));
  }

  std::ostream &os_;
};

/**
 * InputArchive for deserialization (reading)
 * Mirror of OutputArchive. Any short read, non-canonical bool or length
 * prefix larger than the remaining input sets failed(); once failed, every
 * later read fails too, so callers check once at the end.
 *
 * Usage:
 *   std::istringstream iss(data);
 *   InputArchive ar(iss);
 *   ar & myValue;
 *   if (ar.failed()) { handle error }
 */
class InputArchive {
public:
  explicit InputArchive(std::istream &is) : is_(is) {}

  bool read(bool &value) {
    uint8_t byte = 0;
    if (!readInt(byte)) {
      return false;
    }
    if (byte > 1) {
      failed_ = true;
      return false;
    }
    value = (byte != 0);
    return true;
  }

  template <typename T>
  std::enable_if_t<detail::is_wire_int_v<T>, bool> read(T &value) {
    return readInt(value);
  }

  bool read(uint128 &value) {
    uint64_t high = 0;
    uint64_t low = 0;
    if (!readInt(high) || !readInt(low)) {
      return false;
    }
    value = (static_cast<uint128>(high) << 64) | low;
    return true;
  }

  bool read(std::string &value) {
    uint64_t size = 0;
    if (!readLength(size)) {
      return false;
    }
    value.resize(size);
    if (size > 0 && !is_.read(&value[0], static_cast<std::streamsize>(size))) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename T> bool read(std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    static_assert(!detail::is_floating_v<T>,
                  "Archive does not support floating point");
    // Every element takes at least one byte, so the count is bounded too
    uint64_t size = 0;
    if (!readLength(size)) {
      return false;
    }
    value.clear();
    value.reserve(size);
    for (uint64_t i = 0; i < size; ++i) {
      T item{};
      (*this) & item;
      if (failed_) {
        return false;
      }
      value.push_back(std::move(item));
    }
    return true;
  }

  template <typename T, size_t N> bool read(std::array<T, N> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    static_assert(!detail::is_floating_v<T>,
                  "Archive does not support floating point");
    if constexpr (std::is_same_v<T, uint8_t>) {
      if (failed_ || !is_.read(reinterpret_cast<char *>(value.data()), N)) {
        failed_ = true;
        return false;
      }
    } else {
      for (size_t i = 0; i < N; ++i) {
        (*this) & value[i];
        if (failed_) {
          return false;
        }
      }
    }
    return true;
  }

  template <typename T> bool read(std::optional<T> &value) {
    bool present = false;
    if (!read(present)) {
      return false;
    }
    if (!present) {
      value.reset();
      return true;
    }
    T item{};
    (*this) & item;
    if (failed_) {
      return false;
    }
    value = std::move(item);
    return true;
  }

  InputArchive &operator&(bool &value) {
    read(value);
    return *this;
  }

  template <typename T>
  std::enable_if_t<detail::is_wire_int_v<T>, InputArchive &> operator&(T &value) {
    readInt(value);
    return *this;
  }

  InputArchive &operator&(uint128 &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(std::string &value) {
    read(value);
    return *this;
  }

  template <typename T> InputArchive &operator&(std::vector<T> &value) {
    read(value);
    return *this;
  }

  template <typename T, size_t N>
  InputArchive &operator&(std::array<T, N> &value) {
    read(value);
    return *this;
  }

  template <typename T> InputArchive &operator&(std::optional<T> &value) {
    read(value);
    return *this;
  }

  // Operator & for custom types
  template <typename T>
  auto operator&(T &value)
      -> decltype(value.template serialize<InputArchive>(*this), *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    value.template serialize<InputArchive>(*this);
    return *this;
  }

  bool failed() const { return failed_; }

  // True once every byte of the input has been consumed
  bool atEnd() const {
    return is_.peek() == std::char_traits<char>::eof();
  }

  // Mark the archive failed from a custom serialize() (e.g. unknown tag)
  void fail() { failed_ = true; }

private:
  template <typename T> bool readInt(T &value) {
    uint8_t bytes[sizeof(T)];
    if (failed_ || !is_.read(reinterpret_cast<char *>(bytes), sizeof(T))) {
      failed_ = true;
      return false;
    }
    value = detail::getBigEndian<T>(bytes);
    return true;
  }

  // Length prefix that cannot exceed what is left of the input
  bool readLength(uint64_t &size) {
    if (!readInt(size)) {
      return false;
    }
    if (size > remaining()) {
      failed_ = true;
      return false;
    }
    return true;
  }

  uint64_t remaining() const {
    auto pos = is_.tellg();
    if (pos < 0) {
      return 0;
    }
    is_.seekg(0, std::ios::end);
    auto end = is_.tellg();
    is_.seekg(pos);
    return static_cast<uint64_t>(end - pos);
  }

  std::istream &is_;
  bool failed_ = false;
};

} // namespace tally

#endif // TALLY_SERIALIZE_HPP
