#include "Metadata.hpp"
#include <chrono>

using namespace Monofs;

Timestamp Monofs::Now()
{
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Metadata Metadata::Create(EntityKind kind)
{
  Metadata meta;
  meta.Kind = kind;
  meta.CreatedAt = Now();
  meta.ModifiedAt = meta.CreatedAt;
  return meta;
}
