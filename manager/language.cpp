#include "manager/language.hpp"

#include "absl/strings/ascii.h"

namespace manager {

namespace {

const constexpr char* kJavaDefaultClass = "Main";
// Keeps startup fast inside containers with little entropy.
const constexpr char* kJavaRandomSource =
    "-Djava.security.egd=file:/dev/./urandom";

const std::vector<proto::Language>& SupportedLanguages() {
  static const std::vector<proto::Language> languages = {
      proto::JAVASCRIPT, proto::PYTHON, proto::CPP, proto::JAVA,
      proto::CSHARP};
  return languages;
}

bool IsIdentifierChar(char c) { return absl::ascii_isalnum(c) || c == '_'; }

bool IsSpace(char c) { return absl::ascii_isspace(c); }

// If code[pos...] is word followed by at least one space, returns the
// position after the spaces, otherwise std::string::npos.
size_t SkipKeyword(const std::string& code, size_t pos,
                   const std::string& word) {
  if (code.compare(pos, word.size(), word) != 0) return std::string::npos;
  pos += word.size();
  if (pos >= code.size() || !IsSpace(code[pos])) return std::string::npos;
  while (pos < code.size() && IsSpace(code[pos])) pos++;
  return pos;
}

}  // namespace

std::string FindJavaPublicClass(const std::string& code) {
  for (size_t pos = code.find("public"); pos != std::string::npos;
       pos = code.find("public", pos + 1)) {
    if (pos > 0 && IsIdentifierChar(code[pos - 1])) continue;
    size_t name_start = SkipKeyword(code, pos, "public");
    if (name_start == std::string::npos) continue;
    name_start = SkipKeyword(code, name_start, "class");
    if (name_start == std::string::npos) continue;
    size_t name_end = name_start;
    while (name_end < code.size() && IsIdentifierChar(code[name_end]))
      name_end++;
    if (name_end > name_start)
      return code.substr(name_start, name_end - name_start);
  }
  return "";
}

LanguageSpec::LanguageSpec(proto::Language language, LanguageSettings settings)
    : language_(language), settings_(std::move(settings)) {
  switch (language) {
    case proto::JAVASCRIPT:
      id_ = "javascript";
      aliases_ = {"js", "node"};
      tools_ = {"node"};
      break;
    case proto::PYTHON:
      id_ = "python";
      aliases_ = {"py", "python3"};
      tools_ = {"python3"};
      break;
    case proto::CPP:
      id_ = "cpp";
      aliases_ = {"c++"};
      tools_ = {"g++"};
      break;
    case proto::JAVA:
      id_ = "java";
      tools_ = {"javac", "java"};
      break;
    case proto::CSHARP:
      id_ = "csharp";
      aliases_ = {"cs", "c#"};
      tools_ = {"mcs", "mono"};
      break;
    default:
      throw std::domain_error("Unknown language " +
                              proto::Language_Name(language));
  }
}

std::string LanguageSpec::SourceFileName(const std::string& code) const {
  switch (language_) {
    case proto::JAVASCRIPT:
      return "main.js";
    case proto::PYTHON:
      return "main.py";
    case proto::CPP:
      return "main.cpp";
    case proto::JAVA: {
      std::string name = FindJavaPublicClass(code);
      return (name.empty() ? kJavaDefaultClass : name) + ".java";
    }
    case proto::CSHARP:
      return "Main.cs";
    default:
      throw std::domain_error("Unknown language " + id_);
  }
}

std::string LanguageSpec::EntryPoint(const std::string& source_file) const {
  return source_file.substr(0, source_file.find_last_of('.'));
}

bool LanguageSpec::NeedsCompilation() const {
  return language_ == proto::CPP || language_ == proto::JAVA ||
         language_ == proto::CSHARP;
}

std::vector<std::string> LanguageSpec::CompileArgs(
    const std::string& source_file) const {
  switch (language_) {
    case proto::CPP:
      return {"g++", "-O2", "-std=c++17", source_file, "-o",
              EntryPoint(source_file)};
    case proto::JAVA:
      return {"javac", std::string("-J") + kJavaRandomSource, "-d", ".",
              source_file};
    case proto::CSHARP:
      return {"mcs", "-optimize+", "-out:" + EntryPoint(source_file) + ".exe",
              source_file};
    default:
      throw std::domain_error(id_ + " is not a compiled language");
  }
}

std::vector<std::string> LanguageSpec::RunArgs(
    const std::string& source_file) const {
  switch (language_) {
    case proto::JAVASCRIPT:
      return {"node", source_file};
    case proto::PYTHON:
      return {"python3", source_file};
    case proto::CPP:
      return {"./" + EntryPoint(source_file)};
    case proto::JAVA:
      return {"java", kJavaRandomSource, "-Xms16m", "-Xmx256m",
              "-XX:+UseSerialGC", "-cp", ".", EntryPoint(source_file)};
    case proto::CSHARP:
      return {"mono", EntryPoint(source_file) + ".exe"};
    default:
      throw std::domain_error("Unknown language " + id_);
  }
}

LanguageRegistry::LanguageRegistry(
    const std::map<proto::Language, LanguageSettings>& settings) {
  for (proto::Language language : SupportedLanguages()) {
    auto it = settings.find(language);
    LanguageSpec spec(language, it == settings.end()
                                    ? DefaultSettings(language)
                                    : it->second);
    ids_[spec.Id()] = language;
    for (const std::string& alias : spec.Aliases()) ids_[alias] = language;
    specs_.emplace(language, std::move(spec));
  }
}

LanguageSettings LanguageRegistry::DefaultSettings(proto::Language language) {
  LanguageSettings settings;
  settings.limits.cpus = 1.0;
  settings.limits.memory_kb = 512 * 1024;
  settings.limits.max_procs = 256;
  switch (language) {
    case proto::JAVASCRIPT:
      settings.image = "node:20-slim";
      break;
    case proto::PYTHON:
      settings.image = "python:3.11-slim";
      break;
    case proto::CPP:
      settings.image = "gcc:12.2.0";
      break;
    case proto::JAVA:
      settings.image = "eclipse-temurin:17-jdk-jammy";
      break;
    case proto::CSHARP:
      settings.image = "mono:6.12";
      break;
    default:
      throw std::domain_error("Unknown language " +
                              proto::Language_Name(language));
  }
  return settings;
}

const LanguageSpec& LanguageRegistry::Resolve(const std::string& id) const {
  std::string key = absl::AsciiStrToLower(absl::StripAsciiWhitespace(id));
  auto it = ids_.find(key);
  if (it == ids_.end()) throw unsupported_language(id);
  return specs_.at(it->second);
}

const LanguageSpec& LanguageRegistry::Get(proto::Language language) const {
  auto it = specs_.find(language);
  if (it == specs_.end())
    throw unsupported_language(proto::Language_Name(language));
  return it->second;
}

std::vector<const LanguageSpec*> LanguageRegistry::All() const {
  std::vector<const LanguageSpec*> all;
  for (const auto& entry : specs_) all.push_back(&entry.second);
  return all;
}

}  // namespace manager
