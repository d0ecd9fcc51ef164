#include "builder.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "printer.hpp"
#include "runner.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static bool readFile(const std::string &path, std::string &contents)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    return false;
  }

  std::stringstream ss;
  ss << in.rdbuf();
  contents = ss.str();
  return true;
}

int main(int argc, const char *argv[])
{
  Options options;
  try
  {
    options = parseOptions(argc, argv);
  }
  catch (const std::invalid_argument &e)
  {
    std::cerr << e.what() << std::endl << usage();
    return 2;
  }

  if (options.help)
  {
    std::cout << usage();
    return 0;
  }

  std::string text;
  if (!readFile(options.recipePath, text))
  {
    std::cerr << "Could not open recipe " << options.recipePath << std::endl;
    return 2;
  }

  std::ifstream inputFile;
  if (!options.inputPath.empty())
  {
    inputFile.open(options.inputPath);
    if (!inputFile)
    {
      std::cerr << "Could not open input " << options.inputPath << std::endl;
      return 2;
    }
  }
  std::istream &input = options.inputPath.empty() ? std::cin : inputFile;

  try
  {
    Scanner scanner(text.c_str());
    Parser parser(scanner);
    const Program program = ProgramBuilder().build(parser.parse());

    if (options.dump)
    {
      dumpProgram(std::cerr, program);
    }

    Runner runner(program, input, std::cout, Runner::Settings{options.seed, options.maxDepth});
    runner.run();
  }
  catch (const ParseError &)
  {
    // the parser has already reported where
    std::cerr << "Failed to parse " << options.recipePath << std::endl;
    return 1;
  }
  catch (const BuildError &e)
  {
    std::cerr << "Failed to build " << options.recipePath << ": " << e.what() << std::endl;
    return 1;
  }
  catch (const RunError &e)
  {
    std::cout.flush();
    std::cerr << std::endl << "Failed to cook " << options.recipePath << ": " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
