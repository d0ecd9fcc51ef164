#include "runner.hpp"
#include "errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace
{

// arithmetic wraps around instead of overflowing
i64 wrapping(Instruction::Opcode op, i64 a, i64 b)
{
  const auto ua = static_cast<std::uint64_t>(a);
  const auto ub = static_cast<std::uint64_t>(b);
  switch (op)
  {
  case Instruction::Opcode::Add:
    return static_cast<i64>(ua + ub);
  case Instruction::Opcode::Subtract:
    return static_cast<i64>(ua - ub);
  case Instruction::Opcode::Multiply:
    return static_cast<i64>(ua * ub);
  default:
    throw std::logic_error(std::string("Not an arithmetic instruction: ") + opcodeToString(op));
  }
}

}

std::optional<std::string> encodeCodePoint(i64 codePoint)
{
  if (codePoint < 0 || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
  {
    return std::nullopt;
  }

  const auto c = static_cast<u32>(codePoint);
  std::string out;
  if (c < 0x80)
  {
    out += static_cast<char>(c);
  }
  else if (c < 0x800)
  {
    out += static_cast<char>(0xC0 | (c >> 6));
    out += static_cast<char>(0x80 | (c & 0x3F));
  }
  else if (c < 0x10000)
  {
    out += static_cast<char>(0xE0 | (c >> 12));
    out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (c & 0x3F));
  }
  else
  {
    out += static_cast<char>(0xF0 | (c >> 18));
    out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (c & 0x3F));
  }
  return out;
}

Runner::Runner(const Program &program, std::istream &input, std::ostream &output, Settings settings)
: m_program(program), m_input(input), m_output(output), m_settings(settings),
  m_rng(settings.seed ? *settings.seed : std::random_device{}())
{
}

void Runner::run()
{
  const Recipe *main = m_program.find(m_program.mainRecipe);
  if (main == nullptr)
  {
    throw RunError(m_program.mainRecipe, "There is no main recipe to cook");
  }

  Frame frame(*main);
  cook(frame, 0);
  m_output.flush();
}

void Runner::cook(Frame &frame, u32 depth)
{
  const Method &instructions = frame.recipe.instructions;
  frame.ip = 0;

  while (frame.ip < instructions.size())
  {
    const Instruction &ins = instructions[frame.ip];
    try
    {
      if (!step(frame, ins, depth))
      {
        return;
      }
    }
    catch (const std::out_of_range &e)
    {
      throw RunError(frame.recipe.name, (std::stringstream() << ins.location << " " << e.what()).str());
    }
  }
}

// returns false once the recipe is finished early
bool Runner::step(Frame &frame, const Instruction &ins, u32 depth)
{
  switch (ins.op)
  {
  case Instruction::Opcode::Read:
  {
    Frame::Binding &binding = frame.ingredient(ins.ingredient);
    binding.value = Value{read(frame), binding.kind == Ingredient::Kind::Liquid};
    break;
  }
  case Instruction::Opcode::Push:
    frame.bowl(ins.bowl).push(frame.ingredient(ins.ingredient).value);
    break;
  case Instruction::Opcode::Pop:
  {
    Frame::Binding &binding = frame.ingredient(ins.ingredient);
    binding.value = frame.bowl(ins.bowl).pop();
    break;
  }
  case Instruction::Opcode::Add:
  case Instruction::Opcode::Subtract:
  case Instruction::Opcode::Multiply:
  case Instruction::Opcode::Divide:
  {
    const Value operand = frame.ingredient(ins.ingredient).value;
    Value &top = frame.bowl(ins.bowl).top();

    i64 result;
    if (ins.op == Instruction::Opcode::Divide)
    {
      if (operand.number == 0)
      {
        throw RunError(frame.recipe.name, (std::stringstream() << ins.location << " Cannot divide by '"
                                           << ins.ingredient << "', it is 0").str());
      }
      if (operand.number == -1 && top.number == std::numeric_limits<i64>::min())
      {
        throw RunError(frame.recipe.name, (std::stringstream() << ins.location
                                           << " Division overflows").str());
      }
      result = top.number / operand.number;
    }
    else
    {
      result = wrapping(ins.op, top.number, operand.number);
    }

    top = Value{result, operand.liquid};
    break;
  }
  case Instruction::Opcode::AddDry:
    frame.bowl(ins.bowl).push(Value{frame.dryTotal(), false});
    break;
  case Instruction::Opcode::Liquefy:
    frame.ingredient(ins.ingredient).value.liquid = true;
    break;
  case Instruction::Opcode::LiquefyContents:
    frame.bowl(ins.bowl).liquefy();
    break;
  case Instruction::Opcode::Stir:
    frame.bowl(ins.bowl).stir(static_cast<std::size_t>(ins.count.value_or(0)));
    break;
  case Instruction::Opcode::StirIngredient:
  {
    const i64 minutes = frame.ingredient(ins.ingredient).value.number;
    frame.bowl(ins.bowl).stir(minutes < 0 ? 0 : static_cast<std::size_t>(minutes));
    break;
  }
  case Instruction::Opcode::Mix:
    frame.bowl(ins.bowl).shuffle(m_rng);
    break;
  case Instruction::Opcode::ClearStack:
    frame.bowl(ins.bowl).clear();
    break;
  case Instruction::Opcode::CopyStack:
    frame.bowl(ins.bowl).pourInto(frame.dish(ins.dish));
    break;
  case Instruction::Opcode::LoopStart:
    if (frame.ingredient(ins.ingredient).value.number == 0)
    {
      frame.ip = ins.target + 1;
      return true;
    }
    break;
  case Instruction::Opcode::LoopEnd:
    if (!ins.ingredient.empty())
    {
      Value &v = frame.ingredient(ins.ingredient).value;
      v.number = wrapping(Instruction::Opcode::Subtract, v.number, 1);
    }
    frame.ip = ins.target;
    return true;
  case Instruction::Opcode::Break:
    frame.ip = ins.target + 1;
    return true;
  case Instruction::Opcode::Call:
    call(frame, ins, depth);
    break;
  case Instruction::Opcode::Return:
    if (depth == 0 && ins.count)
    {
      serve(frame, *ins.count);
    }
    return false;
  case Instruction::Opcode::PrintStacks:
    // only the main recipe is served
    if (depth == 0)
    {
      serve(frame, ins.count.value_or(0));
    }
    break;
  }

  frame.ip++;
  return true;
}

void Runner::call(Frame &caller, const Instruction &ins, u32 depth)
{
  const Recipe *recipe = m_program.find(ins.name);
  if (recipe == nullptr)
  {
    throw RunError(caller.recipe.name, "There is no recipe called '" + ins.name + "'");
  }
  if (m_settings.maxDepth != 0 && depth + 1 > m_settings.maxDepth)
  {
    throw RunError(caller.recipe.name, "Too many recipes served within each other");
  }

  // the helper works on copies of our bowls, which then replace ours
  Frame callee(*recipe);
  callee.bowls = caller.bowls;
  cook(callee, depth + 1);

  for (const auto &[n, bowl] : callee.bowls)
  {
    caller.bowls[n] = bowl;
  }
}

void Runner::serve(Frame &frame, i64 dishes)
{
  const i64 last = std::min<i64>(dishes, std::numeric_limits<u32>::max());
  for (i64 n = 1; n <= last; n++)
  {
    if (n > 1)
    {
      m_output << '\n';
    }

    // a dish nothing was poured into serves nothing
    const auto it = frame.dishes.find(static_cast<u32>(n));
    if (it == frame.dishes.end())
    {
      continue;
    }
    while (!it->second.empty())
    {
      emit(frame, it->second.pop());
    }
  }
  m_output.flush();
}

void Runner::emit(const Frame &frame, const Value &v)
{
  if (!v.liquid)
  {
    m_output << v.number;
    return;
  }

  const auto encoded = encodeCodePoint(v.number);
  if (!encoded)
  {
    throw RunError(frame.recipe.name, std::to_string(v.number) + " cannot be served as a character");
  }
  m_output << *encoded;
}

i64 Runner::read(const Frame &frame)
{
  i64 v = 0;
  if (!(m_input >> v))
  {
    if (m_input.eof())
    {
      throw RunError(frame.recipe.name, "There is nothing left in the refrigerator");
    }
    throw RunError(frame.recipe.name, "The refrigerator holds something that is not a number");
  }
  return v;
}
