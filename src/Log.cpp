#include "Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace
{
  std::atomic<Monofs::Log::Level> g_Level{Monofs::Log::Level::Error};
  std::mutex g_OutputMutex;

  void Write(std::ostream &out, std::string_view component, const std::string &message)
  {
    std::lock_guard<std::mutex> lock(g_OutputMutex);
    out << component << ": " << message << std::endl;
  }
}

void Monofs::Log::SetLevel(Level level) noexcept
{
  g_Level.store(level, std::memory_order_relaxed);
}

Monofs::Log::Level Monofs::Log::GetLevel() noexcept
{
  return g_Level.load(std::memory_order_relaxed);
}

Monofs::Log::Level Monofs::Log::ParseLevel(std::string_view text)
{
  if (text == "error")
    return Level::Error;
  if (text == "info")
    return Level::Info;
  if (text == "debug")
    return Level::Debug;

  throw std::invalid_argument("unknown log level: " + std::string(text));
}

void Monofs::Log::Error(std::string_view component, const std::string &message)
{
  ::Write(std::cerr, component, message);
}

void Monofs::Log::Info(std::string_view component, const std::string &message)
{
  if (GetLevel() >= Level::Info)
    ::Write(std::cout, component, message);
}

void Monofs::Log::Debug(std::string_view component, const std::string &message)
{
  if (GetLevel() >= Level::Debug)
    ::Write(std::cout, component, message);
}
