/**
 * @file secure_vector.hpp
 * @brief Page-locked, zero-on-release storage for signing secrets and
 *        constant-time comparison helpers
 */

#pragma once

#include <cstdlib>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace tessera {

/**
 * @brief Allocator for key material
 *
 * Allocations are page aligned and locked against swapping where the OS
 * allows it. Memory is zeroed before it is returned to the system.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using pointer = T*;
  using const_pointer = const T*;

  template <typename U>
  struct rebind {
    using other = SecureAllocator<U>;
  };

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  /**
   * @throws std::bad_alloc if the aligned allocation fails
   */
  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    size_t page_size = pageSize();
    size_t aligned_size =
        ((n * sizeof(T) + page_size - 1) / page_size) * page_size;

    T* ptr = static_cast<T*>(std::aligned_alloc(page_size, aligned_size));
    if (!ptr) throw std::bad_alloc();

    // mlock failure (RLIMIT_MEMLOCK) leaves the page swappable but usable
    lock(ptr, aligned_size);
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (!ptr) return;
    size_t size = n * sizeof(T);
    wipe(ptr, size);
    unlock(ptr, size);
    std::free(ptr);
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }

  template <typename U>
  bool operator!=(const SecureAllocator<U>&) const noexcept {
    return false;
  }

 private:
  static size_t pageSize() noexcept {
#ifdef _WIN32
    SYSTEM_INFO si;
    GetSystemInfo(&si);
    return si.dwPageSize;
#else
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
#endif
  }

  static void lock(void* ptr, size_t size) noexcept {
#ifdef _WIN32
    VirtualLock(ptr, size);
#else
    mlock(ptr, size);
#endif
  }

  static void unlock(void* ptr, size_t size) noexcept {
#ifdef _WIN32
    VirtualUnlock(ptr, size);
#else
    munlock(ptr, size);
#endif
  }

  static void wipe(void* ptr, size_t size) noexcept {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    for (size_t i = 0; i < size; ++i) {
      p[i] = 0;
    }
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

namespace secure_utils {

/**
 * @brief XOR-accumulate comparison of two equally sized regions
 * @return 0 if equal, non-zero otherwise
 */
inline int constantTimeCompare(const void* a, const void* b,
                               size_t size) noexcept {
  const volatile unsigned char* va =
      static_cast<const volatile unsigned char*>(a);
  const volatile unsigned char* vb =
      static_cast<const volatile unsigned char*>(b);
  unsigned char result = 0;
  for (size_t i = 0; i < size; ++i) {
    result |= va[i] ^ vb[i];
  }
  return result;
}

/**
 * @brief Constant-time equality for byte sequences
 *
 * Unequal lengths return false immediately; only the length is leaked.
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  return constantTimeCompare(a.data(), b.data(), a.size()) == 0;
}

/**
 * @brief Constant-time equality for text (hex hashes, base64url signatures)
 */
inline bool constantTimeEqual(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  return constantTimeCompare(a.data(), b.data(), a.size()) == 0;
}

}  // namespace secure_utils

}  // namespace tessera
