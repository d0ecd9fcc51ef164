#include "instruction.hpp"

const char *opcodeToString(Instruction::Opcode op)
{
  switch (op)
  {
  case Instruction::Opcode::Read: return "Read";
  case Instruction::Opcode::Push: return "Push";
  case Instruction::Opcode::Pop: return "Pop";
  case Instruction::Opcode::Add: return "Add";
  case Instruction::Opcode::Subtract: return "Subtract";
  case Instruction::Opcode::Multiply: return "Multiply";
  case Instruction::Opcode::Divide: return "Divide";
  case Instruction::Opcode::AddDry: return "AddDry";
  case Instruction::Opcode::Liquefy: return "Liquefy";
  case Instruction::Opcode::LiquefyContents: return "LiquefyContents";
  case Instruction::Opcode::Stir: return "Stir";
  case Instruction::Opcode::StirIngredient: return "StirIngredient";
  case Instruction::Opcode::Mix: return "Mix";
  case Instruction::Opcode::ClearStack: return "ClearStack";
  case Instruction::Opcode::CopyStack: return "CopyStack";
  case Instruction::Opcode::LoopStart: return "LoopStart";
  case Instruction::Opcode::LoopEnd: return "LoopEnd";
  case Instruction::Opcode::Break: return "Break";
  case Instruction::Opcode::Call: return "Call";
  case Instruction::Opcode::Return: return "Return";
  case Instruction::Opcode::PrintStacks: return "PrintStacks";
  }
  return "Unknown";
}

std::ostream &operator<<(std::ostream &os, const Instruction &i)
{
  os << opcodeToString(i.op) << '{';
  switch (i.op)
  {
  case Instruction::Opcode::Read:
  case Instruction::Opcode::Liquefy:
    os << i.ingredient;
    break;
  case Instruction::Opcode::Push:
  case Instruction::Opcode::Pop:
  case Instruction::Opcode::Add:
  case Instruction::Opcode::Subtract:
  case Instruction::Opcode::Multiply:
  case Instruction::Opcode::Divide:
  case Instruction::Opcode::StirIngredient:
    os << i.ingredient << ", bowl " << i.bowl;
    break;
  case Instruction::Opcode::AddDry:
  case Instruction::Opcode::LiquefyContents:
  case Instruction::Opcode::Mix:
  case Instruction::Opcode::ClearStack:
    os << "bowl " << i.bowl;
    break;
  case Instruction::Opcode::Stir:
    os << "bowl " << i.bowl << ", " << i.count.value_or(0);
    break;
  case Instruction::Opcode::CopyStack:
    os << "bowl " << i.bowl << ", dish " << i.dish;
    break;
  case Instruction::Opcode::LoopStart:
  case Instruction::Opcode::LoopEnd:
    os << i.keyword;
    if (!i.ingredient.empty())
    {
      os << ", " << i.ingredient;
    }
    os << ", @" << i.target;
    break;
  case Instruction::Opcode::Break:
    os << '@' << i.target;
    break;
  case Instruction::Opcode::Call:
    os << i.name;
    break;
  case Instruction::Opcode::Return:
  case Instruction::Opcode::PrintStacks:
    if (i.count)
    {
      os << *i.count;
    }
    break;
  }
  return os << '}';
}
