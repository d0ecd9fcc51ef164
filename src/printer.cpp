#include "printer.hpp"

template <typename T>
void RecipePrinter::write(const T &str)
{
  output << str;
}

void RecipePrinter::bowl(u32 n)
{
  write("the mixing bowl");
  if (n != 1)
  {
    output << ' ' << n;
  }
}

void RecipePrinter::dish(u32 n)
{
  write("the baking dish");
  if (n != 1)
  {
    output << ' ' << n;
  }
}

std::string RecipePrinter::print(const Instruction &ins)
{
  output.str("");

  switch (ins.op)
  {
  case Instruction::Opcode::Read:
    write("Take " + ins.ingredient + " from the refrigerator");
    break;
  case Instruction::Opcode::Push:
    write("Put " + ins.ingredient + " into ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Pop:
    write("Fold " + ins.ingredient + " into ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Add:
    write("Add " + ins.ingredient + " to ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Subtract:
    write("Remove " + ins.ingredient + " from ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Multiply:
    write("Combine " + ins.ingredient + " into ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Divide:
    write("Divide " + ins.ingredient + " into ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::AddDry:
    write("Add dry ingredients to ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Liquefy:
    write("Liquefy " + ins.ingredient);
    break;
  case Instruction::Opcode::LiquefyContents:
    write("Liquefy contents of ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Stir:
  {
    const i64 minutes = ins.count.value_or(0);
    write("Stir ");
    bowl(ins.bowl);
    output << " for " << minutes << (minutes == 1 ? " minute" : " minutes");
    break;
  }
  case Instruction::Opcode::StirIngredient:
    write("Stir " + ins.ingredient + " into ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::Mix:
    write("Mix ");
    bowl(ins.bowl);
    write(" well");
    break;
  case Instruction::Opcode::ClearStack:
    write("Clean ");
    bowl(ins.bowl);
    break;
  case Instruction::Opcode::CopyStack:
    write("Pour contents of ");
    bowl(ins.bowl);
    write(" into ");
    dish(ins.dish);
    break;
  case Instruction::Opcode::LoopStart:
    write(ins.name + " the " + ins.ingredient);
    break;
  case Instruction::Opcode::LoopEnd:
    write(ins.name);
    if (!ins.ingredient.empty())
    {
      write(" the " + ins.ingredient);
    }
    write(" until " + ins.keyword);
    break;
  case Instruction::Opcode::Break:
    write("Set aside");
    break;
  case Instruction::Opcode::Call:
    write("Serve with " + ins.name);
    break;
  case Instruction::Opcode::Return:
    write("Refrigerate");
    if (ins.count)
    {
      output << " for " << *ins.count << (*ins.count == 1 ? " hour" : " hours");
    }
    break;
  case Instruction::Opcode::PrintStacks:
    output << "Serves " << ins.count.value_or(0);
    break;
  }

  write('.');
  return output.str();
}

void dumpProgram(std::ostream &os, const Program &program)
{
  RecipePrinter printer;
  for (const auto &[key, recipe] : program.recipes)
  {
    os << recipe.name << (recipe.name == program.mainRecipe ? " (main)" : "") << ":\n";
    for (const Ingredient &i : recipe.ingredients)
    {
      os << "  - " << i << "\n";
    }
    for (std::size_t n = 0; n < recipe.instructions.size(); n++)
    {
      const Instruction &ins = recipe.instructions[n];
      os << "  " << n << ": " << ins << "  " << printer.print(ins) << "\n";
    }
  }
}
