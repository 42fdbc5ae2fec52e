#pragma once
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

// ----------- Small helpers -----------

inline std::string RandomBytes(size_t n, uint64_t seed = 1234567)
{
  std::mt19937_64 rng{seed};
  std::string s(n, '\0');
  for (size_t i = 0; i < n; ++i)
    s[i] = char(rng() & 0xFF);
  return s;
}

inline fs::path MakeFile(const fs::path &p, std::string_view data)
{
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  return p;
}

inline std::string ReadFile(const fs::path &p)
{
  std::ifstream fi(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(fi)), {});
}

struct TempDir
{
  fs::path dir;
  TempDir()
  {
    static int counter = 0;
    auto base = fs::temp_directory_path();
    for (int i = 0; i < 1000; ++i)
    {
      auto cand = base / ("monofs_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
      if (fs::create_directory(cand))
      {
        dir = cand;
        break;
      }
    }
    if (dir.empty())
      throw std::runtime_error("TempDir: failed to create");
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
};
