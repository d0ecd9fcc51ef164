#include <gtest/gtest.h>

#include "errors.hpp"
#include "phrasebook.hpp"
#include "printer.hpp"
#include "scanner.hpp"

#include <optional>
#include <string>
#include <vector>

// the tokens of one sentence, up to its period
static std::optional<Instruction> statement(const std::string &text)
{
  Scanner scanner(text.c_str());
  std::vector<Token> sentence;
  for (Token t = scanner.next(); !t.isOneOf(Token::Kind::Period, Token::Kind::End); t = scanner.next())
  {
    sentence.push_back(t);
  }
  return readStatement(sentence);
}

static Instruction instruction(const std::string &text)
{
  const std::optional<Instruction> ins = statement(text);
  EXPECT_TRUE(ins.has_value()) << text;
  return ins.value_or(Instruction(Instruction::Opcode::PrintStacks));
}

TEST(Statements, Take) {
  const Instruction ins = instruction("Take flour from refrigerator.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Read);
  EXPECT_EQ(ins.ingredient, "flour");
  EXPECT_EQ(instruction("Take flour from the refrigerator."), ins);
}

TEST(Statements, PutDefaultsToFirstBowl) {
  const Instruction ins = instruction("Put sugar into the mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Push);
  EXPECT_EQ(ins.ingredient, "sugar");
  EXPECT_EQ(ins.bowl, 1u);
  EXPECT_EQ(instruction("Put sugar into mixing bowl."), ins);
}

TEST(Statements, BowlNumbering) {
  const Instruction ins = instruction("Put sugar into mixing bowl 2.");
  EXPECT_EQ(ins.bowl, 2u);
  EXPECT_EQ(instruction("Put sugar into the mixing bowl 2."), ins);
  EXPECT_EQ(instruction("Put sugar into the 2nd mixing bowl."), ins);
  EXPECT_EQ(instruction("Put sugar into 2nd mixing bowl."), ins);
}

TEST(Statements, MultiWordIngredient) {
  const Instruction ins = instruction("Put haricot beans into the 3rd mixing bowl.");
  EXPECT_EQ(ins.ingredient, "haricot beans");
  EXPECT_EQ(ins.bowl, 3u);
}

TEST(Statements, Fold) {
  const Instruction ins = instruction("Fold sugar into the mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Pop);
  EXPECT_EQ(ins.ingredient, "sugar");
}

TEST(Statements, Arithmetic) {
  Instruction ins = instruction("Add sugar to mixing bowl 3.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Add);
  EXPECT_EQ(ins.ingredient, "sugar");
  EXPECT_EQ(ins.bowl, 3u);

  ins = instruction("Remove salt from the mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Subtract);
  EXPECT_EQ(ins.ingredient, "salt");

  ins = instruction("Combine eggs into the 2nd mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Multiply);
  EXPECT_EQ(ins.bowl, 2u);

  ins = instruction("Divide flour into mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Divide);
  EXPECT_EQ(ins.ingredient, "flour");
}

TEST(Statements, ArithmeticWithoutBowl) {
  Instruction ins = instruction("Add sugar.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Add);
  EXPECT_EQ(ins.ingredient, "sugar");
  EXPECT_EQ(ins.bowl, 1u);

  EXPECT_EQ(instruction("Remove salt.").op, Instruction::Opcode::Subtract);
  EXPECT_EQ(instruction("Combine eggs.").op, Instruction::Opcode::Multiply);
  EXPECT_EQ(instruction("Divide flour.").op, Instruction::Opcode::Divide);
}

TEST(Statements, AddDryIngredients) {
  Instruction ins = instruction("Add dry ingredients.");
  EXPECT_EQ(ins.op, Instruction::Opcode::AddDry);
  EXPECT_EQ(ins.bowl, 1u);
  EXPECT_TRUE(ins.ingredient.empty());

  ins = instruction("Add dry ingredients to the mixing bowl 2.");
  EXPECT_EQ(ins.op, Instruction::Opcode::AddDry);
  EXPECT_EQ(ins.bowl, 2u);
}

TEST(Statements, Liquefy) {
  Instruction ins = instruction("Liquefy sugar.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Liquefy);
  EXPECT_EQ(ins.ingredient, "sugar");
  EXPECT_EQ(instruction("Liquify sugar."), ins);

  ins = instruction("Liquefy contents of the mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::LiquefyContents);
  EXPECT_EQ(ins.bowl, 1u);
  EXPECT_EQ(instruction("Liquify contents of mixing bowl."), ins);
}

TEST(Statements, Stir) {
  Instruction ins = instruction("Stir the mixing bowl for 3 minutes.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Stir);
  EXPECT_EQ(ins.count, 3);
  EXPECT_EQ(ins.bowl, 1u);
  EXPECT_EQ(instruction("Stir for 3 minutes."), ins);

  ins = instruction("Stir the 2nd mixing bowl for 1 minute.");
  EXPECT_EQ(ins.count, 1);
  EXPECT_EQ(ins.bowl, 2u);

  ins = instruction("Stir sugar into the mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::StirIngredient);
  EXPECT_EQ(ins.ingredient, "sugar");
}

TEST(Statements, MinutesMustAgree) {
  EXPECT_THROW(statement("Stir for 2 minute."), ParseError);
  EXPECT_THROW(statement("Stir the mixing bowl for 1 minutes."), ParseError);
}

TEST(Statements, Mix) {
  const Instruction ins = instruction("Mix well.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Mix);
  EXPECT_EQ(instruction("Mix the mixing bowl well."), ins);
  EXPECT_EQ(instruction("Mix mixing bowl 4 well.").bowl, 4u);
}

TEST(Statements, Clean) {
  const Instruction ins = instruction("Clean 2nd mixing bowl.");
  EXPECT_EQ(ins.op, Instruction::Opcode::ClearStack);
  EXPECT_EQ(ins.bowl, 2u);
}

TEST(Statements, Pour) {
  Instruction ins = instruction("Pour contents of the mixing bowl into the baking dish.");
  EXPECT_EQ(ins.op, Instruction::Opcode::CopyStack);
  EXPECT_EQ(ins.bowl, 1u);
  EXPECT_EQ(ins.dish, 1u);

  ins = instruction("Pour contents of the 2nd mixing bowl into the 3rd baking dish.");
  EXPECT_EQ(ins.bowl, 2u);
  EXPECT_EQ(ins.dish, 3u);
  EXPECT_EQ(instruction("Pour contents of mixing bowl 2 into baking dish 3."), ins);
}

TEST(Statements, SetAside) {
  EXPECT_EQ(instruction("Set aside.").op, Instruction::Opcode::Break);
}

TEST(Statements, ServeWith) {
  const Instruction ins = instruction("Serve with caramel sauce.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Call);
  EXPECT_EQ(ins.name, "caramel sauce");
}

TEST(Statements, Refrigerate) {
  Instruction ins = instruction("Refrigerate.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Return);
  EXPECT_FALSE(ins.count.has_value());

  ins = instruction("Refrigerate for 2 hours.");
  EXPECT_EQ(ins.op, Instruction::Opcode::Return);
  EXPECT_EQ(ins.count, 2);

  EXPECT_EQ(instruction("Refrigerate for 1 hour.").count, 1);
}

TEST(Statements, HoursMustAgree) {
  EXPECT_THROW(statement("Refrigerate for 1 hours."), ParseError);
  EXPECT_THROW(statement("Refrigerate for 3 hour."), ParseError);
  EXPECT_THROW(statement("Refrigerate for 0 hours."), ParseError);
}

TEST(Statements, LoopStart) {
  const Instruction ins = instruction("Sift the flour.");
  EXPECT_EQ(ins.op, Instruction::Opcode::LoopStart);
  EXPECT_EQ(ins.name, "Sift");
  EXPECT_EQ(ins.ingredient, "flour");
}

TEST(Statements, LoopEnd) {
  Instruction ins = instruction("Sift the flour until sifted.");
  EXPECT_EQ(ins.op, Instruction::Opcode::LoopEnd);
  EXPECT_EQ(ins.name, "Sift");
  EXPECT_EQ(ins.ingredient, "flour");
  EXPECT_EQ(ins.keyword, "sifted");
  EXPECT_EQ(instruction("Sift flour until sifted."), ins);

  ins = instruction("Shake until Shaked.");
  EXPECT_EQ(ins.op, Instruction::Opcode::LoopEnd);
  EXPECT_TRUE(ins.ingredient.empty());
  EXPECT_EQ(ins.keyword, "shaked");
}

TEST(Statements, Unrecognised) {
  EXPECT_FALSE(statement("Whisk a cake.").has_value());
  EXPECT_FALSE(statement("Put sugar.").has_value());
  EXPECT_FALSE(statement("Pour contents of the mixing bowl.").has_value());
}

TEST(Statements, Location) {
  const Instruction ins = instruction("  Set aside.");
  EXPECT_EQ(ins.location, (Token::Location{1, 2}));
}

TEST(Statements, Ordinals) {
  EXPECT_EQ(ordinalValue("1st"), 1u);
  EXPECT_EQ(ordinalValue("2nd"), 2u);
  EXPECT_EQ(ordinalValue("3rd"), 3u);
  EXPECT_EQ(ordinalValue("11th"), 11u);
  EXPECT_FALSE(ordinalValue("0th").has_value());
  EXPECT_FALSE(ordinalValue("th").has_value());
  EXPECT_FALSE(ordinalValue("first").has_value());
}

TEST(Statements, MatchPhrase) {
  Scanner scanner = "Put the sugar into mixing bowl 5";
  std::vector<Token> sentence;
  for (Token t = scanner.next(); !t.is(Token::Kind::End); t = scanner.next())
    sentence.push_back(t);

  Captures captures;
  ASSERT_TRUE(matchPhrase("Put <ing> into <bowl>", sentence, captures));
  EXPECT_EQ(captures.ingredient, "the sugar");
  EXPECT_EQ(captures.bowl, 5u);

  Captures other;
  EXPECT_FALSE(matchPhrase("Put <ing> into <dish>", sentence, other));
}

TEST(Statements, PrintedStatementsReadBack) {
  const char *sentences[] = {
    "Take flour from the refrigerator.",
    "Put sugar into the mixing bowl 2.",
    "Fold sugar into the mixing bowl.",
    "Add sugar to the mixing bowl.",
    "Remove salt from the mixing bowl 3.",
    "Combine eggs into the mixing bowl.",
    "Divide flour into the mixing bowl.",
    "Add dry ingredients to the mixing bowl 2.",
    "Liquefy sugar.",
    "Liquefy contents of the mixing bowl.",
    "Stir the mixing bowl 2 for 3 minutes.",
    "Stir the mixing bowl for 1 minute.",
    "Stir sugar into the mixing bowl.",
    "Mix the mixing bowl well.",
    "Clean the mixing bowl 4.",
    "Pour contents of the mixing bowl 2 into the baking dish 3.",
    "Sift the flour.",
    "Sift the flour until sifted.",
    "Sift until sifted.",
    "Set aside.",
    "Serve with caramel sauce.",
    "Refrigerate.",
    "Refrigerate for 2 hours.",
  };

  RecipePrinter printer;
  for (const char *sentence : sentences)
  {
    const Instruction ins = instruction(sentence);
    const std::string printed = printer.print(ins);
    EXPECT_EQ(printed, sentence);
    EXPECT_EQ(instruction(printed), ins) << printed;
  }
}
