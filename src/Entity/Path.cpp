#include "Path.hpp"
#include "../Errors.hpp"
#include "Dir.hpp"
#include "File.hpp"
#include "SymLink.hpp"

using namespace Monofs;

namespace
{
  Entity &Walk(Dir &root, const std::vector<std::string> &segments, size_t count, bool followLast, int &hops);

  Entity &Follow(Dir &root, const SymLink &link, int &hops)
  {
    if (++hops > Path::MaxFollowDepth)
      throw TooManyLinksError(link.GetTarget());

    std::string_view target = link.GetTarget();
    while (!target.empty() && target.front() == '/')
      target.remove_prefix(1);
    if (target.empty())
      return root;

    const auto segments = Path::Split(target);
    return Walk(root, segments, segments.size(), true, hops);
  }

  /// @brief Resolve the first @p count segments, starting at @p root.
  Entity &Walk(Dir &root, const std::vector<std::string> &segments, size_t count, bool followLast, int &hops)
  {
    Entity *entity = &root;
    for (size_t i = 0; i < count; i++)
    {
      if (entity->Kind() != EntityKind::Directory)
        throw NotADirectoryError(segments[i - 1]);

      entity = &entity->AsDir().Get(segments[i]);
      if (entity->Kind() == EntityKind::SymLink && (followLast || i + 1 < count))
        entity = &::Follow(root, entity->AsSymLink(), hops);
    }

    return *entity;
  }

  Dir &Parent(Dir &root, const std::vector<std::string> &segments)
  {
    int hops = 0;
    Entity &parent = ::Walk(root, segments, segments.size() - 1, true, hops);
    if (parent.Kind() != EntityKind::Directory)
      throw NotADirectoryError(segments[segments.size() - 2]);
    return parent.AsDir();
  }
}

bool Monofs::Path::IsValidSegment(std::string_view segment) noexcept
{
  if (segment.empty() || segment == "." || segment == "..")
    return false;

  return segment.find('/') == std::string_view::npos && segment.find('\0') == std::string_view::npos;
}

void Monofs::Path::ValidateSegment(std::string_view segment)
{
  if (!IsValidSegment(segment))
    throw InvalidPathError("'" + std::string(segment) + "' is not a valid name");
}

std::vector<std::string> Monofs::Path::Split(std::string_view path)
{
  if (path.empty())
    throw InvalidPathError("path is empty");
  if (path.front() == '/')
    throw InvalidPathError("'" + std::string(path) + "' must be relative");

  std::vector<std::string> segments;
  size_t start = 0;
  for (;;)
  {
    const size_t end = path.find('/', start);
    const auto segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    ValidateSegment(segment);
    segments.emplace_back(segment);

    if (end == std::string_view::npos)
      break;
    start = end + 1;
  }

  return segments;
}

Entity &Monofs::Path::Find(Dir &root, std::string_view path, bool followLast)
{
  const auto segments = Split(path);

  int hops = 0;
  return ::Walk(root, segments, segments.size(), followLast, hops);
}

Dir &Monofs::Path::FindDir(Dir &root, std::string_view path)
{
  Entity &entity = Find(root, path);
  if (entity.Kind() != EntityKind::Directory)
    throw NotADirectoryError(std::string(path));
  return entity.AsDir();
}

File &Monofs::Path::FindFile(Dir &root, std::string_view path)
{
  Entity &entity = Find(root, path);
  if (entity.Kind() != EntityKind::File)
    throw NotAFileError(std::string(path));
  return entity.AsFile();
}

Dir &Monofs::Path::CreateDirs(Dir &root, std::string_view path)
{
  int hops = 0;
  Dir *dir = &root;
  for (const auto &segment : Split(path))
  {
    if (!dir->Contains(segment))
    {
      dir = &dir->CreateDir(segment);
      continue;
    }

    Entity *entity = &dir->Get(segment);
    if (entity->Kind() == EntityKind::SymLink)
      entity = &::Follow(root, entity->AsSymLink(), hops);
    if (entity->Kind() != EntityKind::Directory)
      throw NotADirectoryError(segment);

    dir = &entity->AsDir();
  }

  return *dir;
}

File &Monofs::Path::CreateFile(Dir &root, std::string_view path)
{
  const auto segments = Split(path);
  return ::Parent(root, segments).CreateFile(segments.back());
}

SymLink &Monofs::Path::CreateSymLink(Dir &root, std::string_view path, const std::string &target)
{
  const auto segments = Split(path);
  return ::Parent(root, segments).CreateSymLink(segments.back(), target);
}
