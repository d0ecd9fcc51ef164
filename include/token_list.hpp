// X(kind, str, is_kw)
X(Word, "Word", false)
X(Number, "Number", false)
X(Period, "Period", false)
X(LineBreak, "LineBreak", false)
X(BlankLine, "BlankLine", false)
X(Ingredients, "Ingredients", true)
X(Method, "Method", true)
X(Serves, "Serves", true)
X(End, "End", false)
X(Unexpected, "Unexpected", false)
