#include <gtest/gtest.h>

#include "../Entity/Dir.hpp"
#include "../Entity/File.hpp"
#include "../Entity/Path.hpp"
#include "../Entity/SymLink.hpp"
#include "../Errors.hpp"
#include "../Store/MemoryStore.hpp"

using namespace Monofs;

TEST(Path, Split_BreaksOnSlashes)
{
  EXPECT_EQ(Path::Split("a"), std::vector<std::string>{"a"});
  EXPECT_EQ(Path::Split("a/b/c.txt"), (std::vector<std::string>{"a", "b", "c.txt"}));
}

TEST(Path, Split_RejectsMalformedPaths)
{
  for (const char *path : {"", "/abs", "a//b", "a/", "a/../b", "./a"})
    EXPECT_THROW((void)Path::Split(path), InvalidPathError) << "'" << path << "'";
}

TEST(Path, Segments)
{
  EXPECT_TRUE(Path::IsValidSegment("file.txt"));
  EXPECT_TRUE(Path::IsValidSegment("..hidden"));
  EXPECT_FALSE(Path::IsValidSegment(".."));
  EXPECT_FALSE(Path::IsValidSegment("a/b"));
}

TEST(Path, CreateAndFind_NestedEntities)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);

  auto &dir = Path::CreateDirs(*root, "src/lib");
  EXPECT_EQ(&Path::CreateDirs(*root, "src/lib"), &dir) << "existing directories are reused";

  auto &file = Path::CreateFile(*root, "src/lib/util.cpp");
  EXPECT_EQ(&Path::FindFile(*root, "src/lib/util.cpp"), &file);
  EXPECT_EQ(&Path::FindDir(*root, "src/lib"), &dir);
  EXPECT_EQ(Path::Find(*root, "src").Kind(), EntityKind::Directory);
}

TEST(Path, Find_AfterReload)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateDirs(*root, "a/b");
  auto out = Path::CreateFile(*root, "a/b/c").GetOutputStream();
  out.Write("deep");
  out.Close();

  const Cid cid = root->Checkpoint();
  auto loaded = Dir::Load(cid, store);
  EXPECT_EQ(Path::FindFile(*loaded, "a/b/c").ReadAll(), "deep");
}

TEST(Path, Errors)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateDirs(*root, "docs/img");
  (void)Path::CreateFile(*root, "docs/readme");

  EXPECT_THROW((void)Path::Find(*root, "docs/missing"), NotFoundError);
  EXPECT_THROW((void)Path::Find(*root, "nowhere/readme"), NotFoundError);
  EXPECT_THROW((void)Path::FindFile(*root, "docs/img"), NotAFileError);
  EXPECT_THROW((void)Path::FindDir(*root, "docs/readme"), NotADirectoryError);
  EXPECT_THROW((void)Path::Find(*root, "docs/readme/x"), NotADirectoryError);
  EXPECT_THROW((void)Path::CreateFile(*root, "missing/file"), NotFoundError);
  EXPECT_THROW((void)Path::CreateFile(*root, "docs/readme"), AlreadyExistsError);
  EXPECT_THROW((void)Path::CreateDirs(*root, "docs/readme/sub"), NotADirectoryError);
}

namespace
{
  void WriteContent(File &file, std::string_view content)
  {
    auto out = file.GetOutputStream();
    out.Write(content);
    out.Close();
  }
}

TEST(Path, SymLinks_AreFollowedFromTheRoot)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateDirs(*root, "real/inner");
  WriteContent(Path::CreateFile(*root, "real/inner/data"), "payload");

  (void)Path::CreateSymLink(*root, "alias", "real");
  (void)Path::CreateSymLink(*root, "real/inner/self", "/real/inner/data");

  EXPECT_EQ(Path::FindFile(*root, "alias/inner/data").ReadAll(), "payload");
  EXPECT_EQ(Path::FindFile(*root, "real/inner/self").ReadAll(), "payload");
  EXPECT_EQ(&Path::FindDir(*root, "alias"), &Path::FindDir(*root, "real"));

  auto &link = Path::Find(*root, "alias", false);
  EXPECT_EQ(link.Kind(), EntityKind::SymLink);
  EXPECT_EQ(link.AsSymLink().GetTarget(), "real");
}

TEST(Path, SymLinks_CreateThroughLinkedDirectories)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateDirs(*root, "real");
  (void)Path::CreateSymLink(*root, "alias", "real");

  (void)Path::CreateFile(*root, "alias/new");
  EXPECT_EQ(&Path::CreateDirs(*root, "alias"), &Path::FindDir(*root, "real"));
  EXPECT_TRUE(Path::FindDir(*root, "real").Contains("new"));
}

TEST(Path, SymLinkLoop_IsTooManyLinks)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateSymLink(*root, "a", "b");
  (void)Path::CreateSymLink(*root, "b", "a");
  (void)Path::CreateSymLink(*root, "self", "self/x");

  EXPECT_THROW((void)Path::Find(*root, "a"), TooManyLinksError);
  EXPECT_THROW((void)Path::Find(*root, "self/y"), TooManyLinksError);
  EXPECT_NO_THROW((void)Path::Find(*root, "a", false));
}

TEST(Path, SymLinkChain_WithinLimitResolves)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  WriteContent(root->CreateFile("end"), "reached");

  std::string previous = "end";
  for (int i = 0; i < Path::MaxFollowDepth; ++i)
  {
    const std::string name = "l" + std::to_string(i);
    (void)root->CreateSymLink(name, previous);
    previous = name;
  }
  EXPECT_EQ(Path::FindFile(*root, previous).ReadAll(), "reached");

  (void)root->CreateSymLink("one-too-many", previous);
  EXPECT_THROW((void)Path::Find(*root, "one-too-many"), TooManyLinksError);
}

TEST(Path, BrokenSymLink_IsNotFound)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)root->CreateSymLink("dangling", "nowhere/file");
  (void)root->CreateSymLink("escape", "../outside");

  EXPECT_THROW((void)Path::Find(*root, "dangling"), NotFoundError);
  EXPECT_THROW((void)Path::Find(*root, "escape"), InvalidPathError);
  EXPECT_THROW((void)root->CreateSymLink("empty", ""), InvalidPathError);
}

TEST(Path, SymLinks_SurviveCheckpoint)
{
  auto store = MemoryStore::Open();
  auto root = Dir::New(store);
  (void)Path::CreateDirs(*root, "docs");
  WriteContent(Path::CreateFile(*root, "docs/readme"), "read me");
  (void)Path::CreateSymLink(*root, "README", "docs/readme");
  const Cid first = root->Checkpoint();

  auto loaded = Dir::Load(first, store);
  EXPECT_EQ(Path::FindFile(*loaded, "README").ReadAll(), "read me");

  loaded->GetSymLink("README").SetTarget("docs");
  EXPECT_TRUE(loaded->IsDirty());
  const Cid second = loaded->Checkpoint();
  EXPECT_NE(first, second);
  EXPECT_EQ(Path::Find(*Dir::Load(second, store), "README").Kind(), EntityKind::Directory);
  EXPECT_EQ(Dir::Load(first, store)->GetSymLink("README").GetTarget(), "docs/readme");
}
