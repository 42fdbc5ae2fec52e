#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace Monofs
{
  class Entity;
  class File;
  class Dir;
  class SymLink;
}

/// @brief Name resolution over a Dir chain: "a/b/c" becomes repeated Get(name) calls.
///
/// Symlinks met along the way are followed. A link target is resolved from the root passed
/// to the walk; a leading '/' in the target is ignored.
namespace Monofs::Path
{
  /// @brief Symlinks one walk may follow before failing with TooManyLinksError.
  constexpr int MaxFollowDepth = 32;

  /// @brief A valid segment is non-empty, is not "." or "..", and contains no '/' or NUL.
  [[nodiscard]] bool IsValidSegment(std::string_view segment) noexcept;

  /// @throws InvalidPathError when @p segment is not a valid segment.
  void ValidateSegment(std::string_view segment);

  /// @brief Split a relative '/'-separated path into validated segments.
  /// @throws InvalidPathError for empty or absolute paths and for invalid segments.
  [[nodiscard]] std::vector<std::string> Split(std::string_view path);

  /// @param followLast When false, a symlink named by the last segment is returned itself.
  /// @throws NotFoundError, NotADirectoryError (for an intermediate file), InvalidPathError,
  ///         TooManyLinksError
  [[nodiscard]] Entity &Find(Dir &root, std::string_view path, bool followLast = true);
  [[nodiscard]] Dir &FindDir(Dir &root, std::string_view path);
  [[nodiscard]] File &FindFile(Dir &root, std::string_view path);

  /// @brief Create every missing directory along @p path; existing directories are reused.
  /// @throws NotADirectoryError when a segment names a file.
  Dir &CreateDirs(Dir &root, std::string_view path);

  /// @brief Create a file at @p path. Its parent directory must already exist.
  /// @throws NotFoundError, NotADirectoryError, AlreadyExistsError, InvalidPathError
  File &CreateFile(Dir &root, std::string_view path);

  /// @brief Create a symlink at @p path pointing to @p target. Its parent directory must already exist.
  SymLink &CreateSymLink(Dir &root, std::string_view path, const std::string &target);
}
