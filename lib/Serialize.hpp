#ifndef HX_LEDGER_SERIALIZE_HPP
#define HX_LEDGER_SERIALIZE_HPP

#include <cstdint>
#include <cstring>
#include <istream>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hx {

namespace detail {

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};

template <typename T> struct is_set : std::false_type {};
template <typename T, typename C, typename A>
struct is_set<std::set<T, C, A>> : std::true_type {};

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

// Upper bound for any length prefix read back from an archive. Rejects
// corrupted input before it turns into a huge allocation.
constexpr uint64_t MAX_ARCHIVE_LENGTH = 64ull * 1024 * 1024;

} // namespace detail

/**
 * Canonical binary writer.
 *
 * Integers are big endian with the width of their C++ type, bool is one
 * byte, double is its IEEE 754 bit pattern in big endian, strings and
 * containers carry a uint64 length prefix. Only ordered containers are
 * accepted so that the encoding of equal content is always identical,
 * which is what record hashing relies on.
 *
 * Custom types provide:
 *   template <typename Archive> void serialize(Archive &ar) { ar & a & b; }
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  template <typename T> OutputArchive &operator&(const T &value) {
    write(value);
    return *this;
  }

private:
  void writeBytes(const void *data, size_t size) {
    os_.write(static_cast<const char *>(data),
              static_cast<std::streamsize>(size));
  }

  template <typename U> void writeBigEndian(U value) {
    uint8_t bytes[sizeof(U)];
    for (size_t i = 0; i < sizeof(U); ++i) {
      bytes[sizeof(U) - 1 - i] = static_cast<uint8_t>(value & 0xff);
      value = static_cast<U>(value >> 8);
    }
    writeBytes(bytes, sizeof(U));
  }

  template <typename T> void write(const T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    static_assert(!std::is_floating_point_v<T> || std::is_same_v<T, double>,
                  "Archive only supports double as floating point type");

    if constexpr (std::is_same_v<T, bool>) {
      uint8_t byte = value ? 1 : 0;
      writeBytes(&byte, 1);
    } else if constexpr (std::is_enum_v<T>) {
      write(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::is_integral_v<T>) {
      writeBigEndian(static_cast<std::make_unsigned_t<T>>(value));
    } else if constexpr (std::is_same_v<T, double>) {
      uint64_t bits = 0;
      std::memcpy(&bits, &value, sizeof(bits));
      writeBigEndian(bits);
    } else if constexpr (std::is_same_v<T, std::string>) {
      writeBigEndian(static_cast<uint64_t>(value.size()));
      writeBytes(value.data(), value.size());
    } else if constexpr (detail::is_vector<T>::value ||
                         detail::is_set<T>::value) {
      writeBigEndian(static_cast<uint64_t>(value.size()));
      for (const auto &item : value) {
        write(item);
      }
    } else if constexpr (detail::is_map<T>::value) {
      writeBigEndian(static_cast<uint64_t>(value.size()));
      for (const auto &entry : value) {
        write(entry.first);
        write(entry.second);
      }
    } else if constexpr (detail::is_pair<T>::value) {
      write(value.first);
      write(value.second);
    } else {
      // serialize() is shared between reading and writing, so it is non-const
      const_cast<T &>(value).serialize(*this);
    }
  }

  std::ostream &os_;
};

/**
 * Counterpart of OutputArchive. Any short read or oversized length prefix
 * marks the archive as failed; later reads become no-ops.
 */
class InputArchive {
public:
  explicit InputArchive(std::istream &is) : is_(is) {}

  template <typename T> InputArchive &operator&(T &value) {
    read(value);
    return *this;
  }

  bool failed() const { return failed_; }

private:
  bool readBytes(void *data, size_t size) {
    if (failed_) {
      return false;
    }
    if (size > 0 &&
        !is_.read(static_cast<char *>(data), static_cast<std::streamsize>(size))) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename U> bool readBigEndian(U &value) {
    uint8_t bytes[sizeof(U)];
    if (!readBytes(bytes, sizeof(U))) {
      return false;
    }
    U result = 0;
    for (size_t i = 0; i < sizeof(U); ++i) {
      result = static_cast<U>((result << 8) | bytes[i]);
    }
    value = result;
    return true;
  }

  bool readLength(uint64_t &size) {
    if (!readBigEndian(size)) {
      return false;
    }
    if (size > detail::MAX_ARCHIVE_LENGTH) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename T> void read(T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    if (failed_) {
      return;
    }

    if constexpr (std::is_same_v<T, bool>) {
      uint8_t byte = 0;
      if (readBytes(&byte, 1)) {
        value = (byte != 0);
      }
    } else if constexpr (std::is_enum_v<T>) {
      std::underlying_type_t<T> raw{};
      read(raw);
      value = static_cast<T>(raw);
    } else if constexpr (std::is_integral_v<T>) {
      std::make_unsigned_t<T> raw = 0;
      if (readBigEndian(raw)) {
        value = static_cast<T>(raw);
      }
    } else if constexpr (std::is_same_v<T, double>) {
      uint64_t bits = 0;
      if (readBigEndian(bits)) {
        std::memcpy(&value, &bits, sizeof(bits));
      }
    } else if constexpr (std::is_same_v<T, std::string>) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.resize(static_cast<size_t>(size));
      if (size > 0) {
        readBytes(&value[0], static_cast<size_t>(size));
      }
    } else if constexpr (detail::is_vector<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::value_type item{};
        read(item);
        value.push_back(std::move(item));
      }
    } else if constexpr (detail::is_set<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::value_type item{};
        read(item);
        value.insert(std::move(item));
      }
    } else if constexpr (detail::is_map<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::key_type key{};
        typename T::mapped_type mapped{};
        read(key);
        read(mapped);
        value[std::move(key)] = std::move(mapped);
      }
    } else if constexpr (detail::is_pair<T>::value) {
      read(value.first);
      read(value.second);
    } else {
      value.serialize(*this);
    }
  }

  std::istream &is_;
  bool failed_ = false;
};

} // namespace hx

#endif // HX_LEDGER_SERIALIZE_HPP
