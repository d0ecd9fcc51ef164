#include <gtest/gtest.h>

#include "errors.hpp"
#include "parser.hpp"

#include <string>
#include <vector>

static std::vector<ParsedRecipe> parse(const std::string &text)
{
  Scanner scanner(text.c_str());
  Parser parser(scanner);
  return parser.parse();
}

static Token::Location errorLocation(const std::string &text)
{
  try
  {
    parse(text);
  }
  catch (const ParseError &e)
  {
    return e.location;
  }
  ADD_FAILURE() << "expected a ParseError";
  return {0, 0};
}

TEST(Parser, MinimalRecipe) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Plain Cake.\n"
    "\n"
    "Ingredients.\n"
    "1 g flour\n"
    "\n"
    "Method.\n"
    "Put flour into the mixing bowl.\n"
    "\n"
    "Serves 1.\n");

  ASSERT_EQ(recipes.size(), 1u);
  const ParsedRecipe &r = recipes[0];
  EXPECT_EQ(r.title, "Plain Cake");
  EXPECT_EQ(r.location, (Token::Location{1, 0}));
  EXPECT_TRUE(r.comment.empty());
  ASSERT_EQ(r.ingredients.size(), 1u);
  EXPECT_EQ(r.ingredients[0].name, "flour");
  ASSERT_EQ(r.method.size(), 1u);
  EXPECT_EQ(r.method[0].op, Instruction::Opcode::Push);
  EXPECT_EQ(r.serves, 1);
}

TEST(Parser, MethodOnly) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Nothing.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");

  ASSERT_EQ(recipes.size(), 1u);
  EXPECT_TRUE(recipes[0].ingredients.empty());
  EXPECT_FALSE(recipes[0].serves.has_value());
}

TEST(Parser, Comment) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "A lovely cake.\n"
    "It serves nobody.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");

  EXPECT_EQ(recipes[0].comment, "A lovely cake.\nIt serves nobody.");
}

TEST(Parser, CommentRightAfterTitle) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "A lovely cake.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");

  EXPECT_EQ(recipes[0].title, "Cake");
  EXPECT_EQ(recipes[0].comment, "A lovely cake.");
}

TEST(Parser, CookingTimeAndOven) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "Ingredients.\n"
    "1 g flour\n"
    "\n"
    "Cooking time: 25 minutes.\n"
    "\n"
    "Pre-heat oven to 180 degrees Celsius (gas mark 4).\n"
    "\n"
    "Method.\n"
    "Put flour into the mixing bowl.\n"
    "\n"
    "Serves 1.\n");

  const ParsedRecipe &r = recipes[0];
  EXPECT_EQ(r.cookingTime, 25);
  EXPECT_EQ(r.ovenTemperature, 180);
  EXPECT_EQ(r.gasMark, 4);
  EXPECT_EQ(r.method.size(), 1u);
}

TEST(Parser, OvenWithoutGasMark) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "Pre-heat oven to 200 degrees Celsius.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");

  EXPECT_EQ(recipes[0].ovenTemperature, 200);
  EXPECT_FALSE(recipes[0].gasMark.has_value());
}

TEST(Parser, BadCookingTime) {
  EXPECT_THROW(parse("Cake.\n\nCooking time: soon.\n\nMethod.\nSet aside.\n"), ParseError);
}

TEST(Parser, CommentStartingLikeAHeading) {
  std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "Cooking is fun.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");
  EXPECT_EQ(recipes[0].comment, "Cooking is fun.");
  EXPECT_FALSE(recipes[0].cookingTime.has_value());

  recipes = parse(
    "Cake.\n"
    "\n"
    "Pre-heat the pan first.\n"
    "\n"
    "Cooking time: 5 minutes.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");
  EXPECT_EQ(recipes[0].comment, "Pre-heat the pan first.");
  EXPECT_EQ(recipes[0].cookingTime, 5);
  EXPECT_FALSE(recipes[0].ovenTemperature.has_value());
}

TEST(Parser, TitleSpacing) {
  const std::vector<ParsedRecipe> recipes = parse("Plum  Jam \t.\n\nMethod.\nSet aside.\n");
  EXPECT_EQ(recipes[0].title, "Plum Jam");
}

TEST(Parser, PeriodInsideTitle) {
  EXPECT_EQ(errorLocation("Mrs. Beeton's Jam.\n\nMethod.\nSet aside.\n"), (Token::Location{1, 3}));
}

TEST(Parser, StatementsSpanLines) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "Method.\n"
    "Put flour into\n"
    "the mixing bowl. Fold flour into the mixing bowl.\n");

  const Method &method = recipes[0].method;
  ASSERT_EQ(method.size(), 2u);
  EXPECT_EQ(method[0].op, Instruction::Opcode::Push);
  EXPECT_EQ(method[0].location, (Token::Location{4, 0}));
  EXPECT_EQ(method[1].op, Instruction::Opcode::Pop);
  EXPECT_EQ(method[1].location, (Token::Location{5, 17}));
}

TEST(Parser, ServesWithoutBlankLine) {
  const std::vector<ParsedRecipe> recipes = parse(
    "Cake.\n"
    "\n"
    "Method.\n"
    "Set aside.\n"
    "Serves 2.\n");

  EXPECT_EQ(recipes[0].method.size(), 1u);
  EXPECT_EQ(recipes[0].serves, 2);
}

TEST(Parser, SeveralRecipes) {
  const std::vector<ParsedRecipe> recipes = parse(
    "\n"
    "Main Course.\n"
    "\n"
    "Method.\n"
    "Serve with caramel sauce.\n"
    "\n"
    "Serves 1.\n"
    "\n"
    "\n"
    "Caramel Sauce.\n"
    "\n"
    "Ingredients.\n"
    "1 kg sugar\n"
    "\n"
    "Method.\n"
    "Put sugar into the mixing bowl.\n"
    "\n");

  ASSERT_EQ(recipes.size(), 2u);
  EXPECT_EQ(recipes[0].title, "Main Course");
  EXPECT_EQ(recipes[0].method[0].op, Instruction::Opcode::Call);
  EXPECT_EQ(recipes[0].method[0].name, "caramel sauce");
  EXPECT_EQ(recipes[1].title, "Caramel Sauce");
  EXPECT_EQ(recipes[1].location, (Token::Location{10, 0}));
  EXPECT_FALSE(recipes[1].serves.has_value());
}

TEST(Parser, RecipesNeedBlankLineBetween) {
  const Token::Location location = errorLocation(
    "Cake.\n"
    "\n"
    "Method.\n"
    "Set aside.\n"
    "\n"
    "Serves 1.\n"
    "Helper.\n"
    "\n"
    "Method.\n"
    "Set aside.\n");

  EXPECT_EQ(location, (Token::Location{7, 0}));
}

TEST(Parser, UnrecognisedStatement) {
  const Token::Location location = errorLocation(
    "Cake.\n"
    "\n"
    "Method.\n"
    "Put flour into the mixing bowl.\n"
    "Whisk a cake.\n");

  EXPECT_EQ(location, (Token::Location{5, 0}));
}

TEST(Parser, AgreementErrorHasLocation) {
  const Token::Location location = errorLocation(
    "Cake.\n"
    "\n"
    "Method.\n"
    "Set aside. Refrigerate for 1 hours.\n");

  EXPECT_EQ(location, (Token::Location{4, 11}));
}

TEST(Parser, MissingPeriod) {
  EXPECT_THROW(parse("Cake.\n\nMethod.\nSet aside\n"), ParseError);
  EXPECT_THROW(parse("Cake\n\nMethod.\nSet aside.\n"), ParseError);
}

TEST(Parser, MissingMethod) {
  EXPECT_THROW(parse("Cake.\n\nIngredients.\n1 g flour\n"), ParseError);
  EXPECT_THROW(parse("Cake.\n\nMethod.\n\nServes 1.\n"), ParseError);
}

TEST(Parser, EmptyText) {
  EXPECT_THROW(parse(""), ParseError);
  EXPECT_THROW(parse("\n\n\n"), ParseError);
}

TEST(Parser, ServesNeedsDiners) {
  EXPECT_THROW(parse("Cake.\n\nMethod.\nSet aside.\n\nServes 0.\n"), ParseError);
  EXPECT_THROW(parse("Cake.\n\nMethod.\nSet aside.\n\nServes many.\n"), ParseError);
}
