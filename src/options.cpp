#include "options.hpp"

#include <stdexcept>
#include <string_view>

namespace
{

u32 number(std::string_view option, const std::string &text)
{
  std::size_t used = 0;
  unsigned long parsed = 0;
  try
  {
    parsed = std::stoul(text, &used);
  }
  catch (const std::logic_error &)
  {
    throw std::invalid_argument(std::string(option) + " expects a number, not '" + text + "'");
  }
  if (used != text.size() || parsed > 0xFFFFFFFFul || text.starts_with('-'))
  {
    throw std::invalid_argument(std::string(option) + " expects a number, not '" + text + "'");
  }
  return static_cast<u32>(parsed);
}

}

const char *usage()
{
  return "usage: chef [--seed N] [--max-depth N] [--dump] [--input FILE] RECIPE\n"
         "  --seed N       seed the shuffle used by 'Mix well'\n"
         "  --max-depth N  stop after N nested 'Serve with', 0 for no limit (default 1000)\n"
         "  --dump         print the program before cooking it\n"
         "  --input FILE   take refrigerator values from FILE instead of stdin\n";
}

Options parseOptions(int argc, const char *const argv[])
{
  Options options{};

  for (int i = 1; i < argc; i++)
  {
    const std::string_view arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
      {
        throw std::invalid_argument(std::string(arg) + " needs a value");
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h")
    {
      options.help = true;
    }
    else if (arg == "--dump")
    {
      options.dump = true;
    }
    else if (arg == "--input")
    {
      options.inputPath = value();
    }
    else if (arg == "--seed")
    {
      options.seed = number(arg, value());
    }
    else if (arg == "--max-depth")
    {
      options.maxDepth = number(arg, value());
    }
    else if (arg.starts_with("-") && arg.size() > 1)
    {
      throw std::invalid_argument("Unknown option " + std::string(arg));
    }
    else if (options.recipePath.empty())
    {
      options.recipePath = arg;
    }
    else
    {
      throw std::invalid_argument("Only one recipe can be cooked at a time");
    }
  }

  if (options.recipePath.empty() && !options.help)
  {
    throw std::invalid_argument("No recipe given");
  }

  return options;
}
