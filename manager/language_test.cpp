#include "manager/language.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using manager::FindJavaPublicClass;
using manager::LanguageRegistry;
using manager::LanguageSpec;

// NOLINTNEXTLINE
TEST(LanguageRegistryTest, ResolvesIdsAndAliases) {
  LanguageRegistry registry;
  EXPECT_EQ(registry.Resolve("cpp").Language(), proto::CPP);
  EXPECT_EQ(registry.Resolve("C++").Language(), proto::CPP);
  EXPECT_EQ(registry.Resolve("python").Language(), proto::PYTHON);
  EXPECT_EQ(registry.Resolve("py").Language(), proto::PYTHON);
  EXPECT_EQ(registry.Resolve("Python3").Language(), proto::PYTHON);
  EXPECT_EQ(registry.Resolve("javascript").Language(), proto::JAVASCRIPT);
  EXPECT_EQ(registry.Resolve("node").Language(), proto::JAVASCRIPT);
  EXPECT_EQ(registry.Resolve(" java ").Language(), proto::JAVA);
  EXPECT_EQ(registry.Resolve("c#").Language(), proto::CSHARP);
  EXPECT_EQ(registry.Resolve("csharp").Id(), "csharp");
}

// NOLINTNEXTLINE
TEST(LanguageRegistryTest, UnknownLanguageIsAClientError) {
  LanguageRegistry registry;
  EXPECT_THROW(registry.Resolve("brainfuck"), manager::unsupported_language);
  EXPECT_THROW(registry.Resolve(""), manager::client_error);
}

// NOLINTNEXTLINE
TEST(LanguageRegistryTest, AllLanguagesInOrder) {
  LanguageRegistry registry;
  std::vector<std::string> ids;
  for (const LanguageSpec* spec : registry.All()) ids.push_back(spec->Id());
  EXPECT_THAT(ids,
              ElementsAre("javascript", "python", "cpp", "java", "csharp"));
}

// NOLINTNEXTLINE
TEST(LanguageRegistryTest, SettingsOverrideDefaults) {
  manager::LanguageSettings settings;
  settings.image = "my/python:latest";
  settings.limits.memory_kb = 1024;
  LanguageRegistry registry({{proto::PYTHON, settings}});
  EXPECT_EQ(registry.Get(proto::PYTHON).Image(), "my/python:latest");
  EXPECT_EQ(registry.Get(proto::PYTHON).Limits().memory_kb, 1024);
  EXPECT_EQ(registry.Get(proto::CPP).Image(), "gcc:12.2.0");
  EXPECT_EQ(registry.Get(proto::CPP).Limits().memory_kb, 512 * 1024);
  EXPECT_EQ(registry.Get(proto::CPP).Limits().max_procs, 256);
}

// NOLINTNEXTLINE
TEST(LanguageSpecTest, Cpp) {
  LanguageRegistry registry;
  const LanguageSpec& cpp = registry.Get(proto::CPP);
  ASSERT_TRUE(cpp.NeedsCompilation());
  EXPECT_EQ(cpp.SourceFileName("int main() {}"), "main.cpp");
  EXPECT_THAT(cpp.CompileArgs("main.cpp"),
              ElementsAre("g++", "-O2", "-std=c++17", "main.cpp", "-o", "main"));
  EXPECT_THAT(cpp.RunArgs("main.cpp"), ElementsAre("./main"));
}

// NOLINTNEXTLINE
TEST(LanguageSpecTest, Interpreted) {
  LanguageRegistry registry;
  const LanguageSpec& python = registry.Get(proto::PYTHON);
  EXPECT_FALSE(python.NeedsCompilation());
  EXPECT_EQ(python.SourceFileName("print(1)"), "main.py");
  EXPECT_THAT(python.RunArgs("main.py"), ElementsAre("python3", "main.py"));
  EXPECT_THAT(python.Tools(), ElementsAre("python3"));
  const LanguageSpec& js = registry.Get(proto::JAVASCRIPT);
  EXPECT_FALSE(js.NeedsCompilation());
  EXPECT_THAT(js.RunArgs("main.js"), ElementsAre("node", "main.js"));
}

// NOLINTNEXTLINE
TEST(LanguageSpecTest, JavaUsesThePublicClass) {
  LanguageRegistry registry;
  const LanguageSpec& java = registry.Get(proto::JAVA);
  std::string code =
      "import java.util.*;\n"
      "public class Solution {\n"
      "  public static void main(String[] args) {}\n"
      "}\n";
  std::string file = java.SourceFileName(code);
  EXPECT_EQ(file, "Solution.java");
  EXPECT_EQ(java.EntryPoint(file), "Solution");
  EXPECT_EQ(java.RunArgs(file).back(), "Solution");
  EXPECT_EQ(java.CompileArgs(file).back(), "Solution.java");
}

// NOLINTNEXTLINE
TEST(LanguageSpecTest, JavaDefaultsToMain) {
  LanguageRegistry registry;
  const LanguageSpec& java = registry.Get(proto::JAVA);
  std::string file = java.SourceFileName(
      "class Foo { public static void main(String[] a) {} }");
  EXPECT_EQ(file, "Main.java");
  EXPECT_THAT(java.RunArgs(file),
              ElementsAre("java", "-Djava.security.egd=file:/dev/./urandom",
                          "-Xms16m", "-Xmx256m", "-XX:+UseSerialGC", "-cp",
                          ".", "Main"));
}

// NOLINTNEXTLINE
TEST(LanguageSpecTest, CSharp) {
  LanguageRegistry registry;
  const LanguageSpec& cs = registry.Get(proto::CSHARP);
  EXPECT_EQ(cs.SourceFileName("class A {}"), "Main.cs");
  EXPECT_THAT(cs.CompileArgs("Main.cs"),
              ElementsAre("mcs", "-optimize+", "-out:Main.exe", "Main.cs"));
  EXPECT_THAT(cs.RunArgs("Main.cs"), ElementsAre("mono", "Main.exe"));
}

// NOLINTNEXTLINE
TEST(FindJavaPublicClassTest, Declarations) {
  EXPECT_EQ(FindJavaPublicClass("public class A{}"), "A");
  EXPECT_EQ(FindJavaPublicClass("public\n\tclass   Big_Name1 {"), "Big_Name1");
  EXPECT_EQ(FindJavaPublicClass("class B {} public class C {}"), "C");
  EXPECT_THAT(FindJavaPublicClass("publicclass D {}"), IsEmpty());
  EXPECT_THAT(FindJavaPublicClass("nonpublic class E {}"), IsEmpty());
  EXPECT_THAT(FindJavaPublicClass("public interface F {}"), IsEmpty());
  EXPECT_THAT(FindJavaPublicClass(""), IsEmpty());
}

}  // namespace
