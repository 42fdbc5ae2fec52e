#include <iostream>
#include <unordered_map>
#include "CAS/CAS.hpp"
#include "Errors.hpp"
#include "Vault.hpp"

/// @brief Parse command line arguments to easy-to-use map.
/// @param argc count of the arguments
/// @param argv argument array.
/// @return
std::unordered_map<std::string_view, std::string_view> parseArgs(int argc, char *argv[])
{
  std::unordered_map<std::string_view, std::string_view> opts;
  for (int i = 1; i < argc; ++i)
  {
    std::string_view arg = argv[i];
    if (arg.starts_with("--"))
    {
      if (i + 1 < argc && !std::string_view(argv[i + 1]).starts_with("--"))
        opts[arg.substr(2)] = argv[++i];
      else
        opts[arg.substr(2)] = "true"; // flag
    }
  }
  return opts;
}

void Usage(std::string programName)
{
  std::cout << "USAGE:" << std::endl;
  std::cout << " - Push <local_folder> as a new version:   " << programName << " --archive <path_to_archive> --push <local_folder>" << std::endl;
  std::cout << " - Pop a version to <local_folder>:        " << programName << " --archive <path_to_archive> --pop <local_folder> [--cid <root_cid>]" << std::endl;
  std::cout << " - List recorded versions:                 " << programName << " --archive <path_to_archive> --log" << std::endl;
  std::cout << "OPTIONS: --chunk-size <bytes> --compression-level <1..22> --log-level <error|info|debug>" << std::endl;
}

int main(int argc, char *argv[])
{

  auto args = parseArgs(argc, argv);

  if (!args.contains("archive"))
  {
    Usage(argv[0]);
    return 1;
  }

  try
  {
    auto config = Monofs::Config::FromEnvironment();
    for (const char *key : {"chunk-size", "compression-level", "log-level"})
    {
      if (args.contains(key))
        config.Set(key, std::string(args[key]));
    }
    Monofs::Log::SetLevel(config.LogLevel);

    auto vault = std::make_unique<Monofs::Vault>(args["archive"], config);

    if (args.contains("push"))
    {
      auto cid = vault->Push(args["push"]);
      std::cout << Monofs::CAS::ToHexString(cid) << std::endl;
    }

    if (args.contains("pop"))
    {
      std::optional<Monofs::Cid> version;
      if (args.contains("cid"))
        version = Monofs::CAS::FromHexString(args["cid"]);

      vault->Pop(args["pop"], version);
    }

    if (args.contains("log"))
    {
      for (const auto &root : vault->History())
        std::cout << root->Id << " " << Monofs::CAS::ToHexString(root->Target) << " " << root->CreatedAt << std::endl;
    }
  }
  catch (const Monofs::Error &e)
  {
    std::cerr << Monofs::ToString(e.Kind()) << ": " << e.what() << std::endl;
    return 2;
  }
  catch (const std::exception &e)
  {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  return 0;
}
