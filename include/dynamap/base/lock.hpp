#pragma once

#include <mutex>
#include <shared_mutex>
#include <type_traits>

namespace dynamap {

using Mutex = std::mutex;
using SharedMutex = std::shared_mutex;

template <typename T>
using UniqueLock = std::unique_lock<T>;
template <typename T>
using SharedLock = std::shared_lock<T>;

} // namespace dynamap

//------------------------------------------------------------------------------
// Unique/shared lock macros
//------------------------------------------------------------------------------
#define DYNAMAP_LOCK_DECL_IMPL_IMPL(mutex, LINE) guard_##LINE(mutex)
#define DYNAMAP_LOCK_DECL_IMPL(mutex, LINE) DYNAMAP_LOCK_DECL_IMPL_IMPL(mutex, LINE)
#define DYNAMAP_LOCK_DECL(mutex) DYNAMAP_LOCK_DECL_IMPL(mutex, __LINE__)

#define DYNAMAP_UNIQUE_LOCK(mutex)                                                                 \
  dynamap::UniqueLock<std::decay_t<decltype(mutex)>> DYNAMAP_LOCK_DECL(mutex)
#define DYNAMAP_SHARED_LOCK(mutex)                                                                 \
  dynamap::SharedLock<std::decay_t<decltype(mutex)>> DYNAMAP_LOCK_DECL(mutex)
