#pragma once

#include "source/common/singleton/threadsafe_singleton.h"

namespace KernelTls {

/**
 * Replaces the instance of a ThreadSafeSingleton for the lifetime of the injector.
 */
template <class T> class TestThreadsafeSingletonInjector {
public:
  TestThreadsafeSingletonInjector(T* instance) {
    latched_instance_ = &ThreadSafeSingleton<T>::get();
    ThreadSafeSingleton<T>::instance_ = instance;
  }
  ~TestThreadsafeSingletonInjector() { ThreadSafeSingleton<T>::instance_ = latched_instance_; }

  T& latched() { return *latched_instance_; }

private:
  T* latched_instance_;
};

} // namespace KernelTls
