#include "builder.hpp"
#include "errors.hpp"
#include "parser.hpp"

#include <utility>

std::string closingKeyword(std::string_view verb)
{
  std::string keyword = recipeKey(verb);
  keyword += keyword.ends_with('e') ? "d" : "ed";
  return keyword;
}

Program ProgramBuilder::build(const std::vector<ParsedRecipe> &parsed)
{
  if (parsed.empty())
  {
    throw BuildError("", "A program needs at least one recipe");
  }

  Program program;
  for (const ParsedRecipe &p : parsed)
  {
    Recipe recipe = assemble(p);
    const std::string key = recipeKey(recipe.name);
    if (program.recipes.contains(key))
    {
      throw BuildError(recipe.name, "A recipe with this title already exists");
    }

    if (program.recipes.empty())
    {
      program.mainRecipe = recipe.name;
    }
    program.recipes.emplace(key, std::move(recipe));
  }

  checkCalls(program);
  return program;
}

Recipe ProgramBuilder::assemble(const ParsedRecipe &parsed)
{
  Recipe recipe;
  recipe.name = parsed.title;
  recipe.ingredients = parsed.ingredients;
  recipe.instructions = parsed.method;

  resolveLoops(recipe);

  if (parsed.serves)
  {
    Instruction serve(Instruction::Opcode::PrintStacks);
    serve.count = parsed.serves;
    recipe.instructions.push_back(std::move(serve));
  }

  return recipe;
}

void ProgramBuilder::resolveLoops(Recipe &recipe)
{
  Method &instructions = recipe.instructions;

  // loop starts still waiting for their end, innermost last
  std::vector<std::size_t> pending;
  // (set aside, the loop start it leaves)
  std::vector<std::pair<std::size_t, std::size_t>> breaks;

  for (std::size_t i = 0; i < instructions.size(); i++)
  {
    Instruction &ins = instructions[i];
    switch (ins.op)
    {
    case Instruction::Opcode::LoopStart:
      ins.keyword = closingKeyword(ins.name);
      pending.push_back(i);
      break;
    case Instruction::Opcode::LoopEnd:
    {
      // loops of other verbs above the match stay open
      auto it = pending.rbegin();
      while (it != pending.rend() && instructions[*it].keyword != ins.keyword)
      {
        ++it;
      }
      if (it == pending.rend())
      {
        throw BuildError(recipe.name, "'" + ins.name + " until " + ins.keyword + "' at " +
                                          (std::stringstream() << ins.location).str() +
                                          " does not close any loop");
      }

      const std::size_t start = *it;
      instructions[start].target = i;
      ins.target = start;
      pending.erase(std::next(it).base());
      break;
    }
    case Instruction::Opcode::Break:
      if (pending.empty())
      {
        throw BuildError(recipe.name, "'Set aside' at " + (std::stringstream() << ins.location).str() +
                                          " is not inside a loop");
      }
      breaks.emplace_back(i, pending.back());
      break;
    default:
      break;
    }
  }

  if (!pending.empty())
  {
    const Instruction &open = instructions[pending.back()];
    throw BuildError(recipe.name, "'" + open.name + " the " + open.ingredient + "' at " +
                                      (std::stringstream() << open.location).str() +
                                      " is never closed with '" + open.keyword + "'");
  }

  for (const auto &[index, start] : breaks)
  {
    instructions[index].target = instructions[start].target;
  }
}

void ProgramBuilder::checkCalls(const Program &program)
{
  for (const auto &[key, recipe] : program.recipes)
  {
    for (const Instruction &ins : recipe.instructions)
    {
      if (ins.op == Instruction::Opcode::Call && program.find(ins.name) == nullptr)
      {
        throw BuildError(recipe.name, "'Serve with " + ins.name + "': there is no such recipe");
      }
    }
  }
}

Program loadProgram(const char *text)
{
  Scanner scanner(text);
  Parser parser(scanner);
  return ProgramBuilder().build(parser.parse());
}
