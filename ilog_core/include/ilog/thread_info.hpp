#pragma once
#include <cstdint>
#include <string>

namespace ilog
{

class ThreadInfo
{
 public:
  static void SetThreadName(const char* name);
  static const char* GetThreadName();
  static uint32_t GetThreadId();

  // "Thread: <name>(<tid>)" or "Thread: <tid>" when unnamed
  static std::string Describe();

 private:
  static thread_local char tls_thread_name_[32];
  static thread_local uint32_t tls_thread_id_;
  static thread_local bool tls_thread_id_cached_;
};

}  // namespace ilog
