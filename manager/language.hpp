#ifndef MANAGER_LANGUAGE_HPP
#define MANAGER_LANGUAGE_HPP

#include <map>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "manager/errors.hpp"
#include "proto/judge.pb.h"

namespace manager {

// The configurable part of a language.
struct LanguageSettings {
  std::string image;
  executor::ResourceLimits limits;
};

// How to build and run programs written in one language.
class LanguageSpec {
 public:
  LanguageSpec(proto::Language language, LanguageSettings settings);

  proto::Language Language() const { return language_; }
  // Canonical identifier, e.g. "cpp".
  const std::string& Id() const { return id_; }
  const std::vector<std::string>& Aliases() const { return aliases_; }
  const std::string& Image() const { return settings_.image; }
  const executor::ResourceLimits& Limits() const { return settings_.limits; }

  // Programs that build and run the code.
  const std::vector<std::string>& Tools() const { return tools_; }

  // Name of the file the code should be saved to. Java files are named after
  // their public class.
  std::string SourceFileName(const std::string& code) const;

  // Name of the class or program to run for the given source file.
  std::string EntryPoint(const std::string& source_file) const;

  bool NeedsCompilation() const;

  // Command line that compiles source_file. Must only be called if
  // NeedsCompilation().
  std::vector<std::string> CompileArgs(const std::string& source_file) const;

  // Command line that runs the (possibly compiled) source_file.
  std::vector<std::string> RunArgs(const std::string& source_file) const;

 private:
  proto::Language language_;
  std::string id_;
  std::vector<std::string> aliases_;
  std::vector<std::string> tools_;
  LanguageSettings settings_;
};

// The languages the engine knows about. Built once, read-only afterwards.
class LanguageRegistry {
 public:
  // Languages without settings use DefaultSettings.
  explicit LanguageRegistry(
      const std::map<proto::Language, LanguageSettings>& settings = {});

  static LanguageSettings DefaultSettings(proto::Language language);

  // Finds a language by its identifier or one of its aliases, ignoring case.
  // Throws unsupported_language if there is none.
  const LanguageSpec& Resolve(const std::string& id) const;

  const LanguageSpec& Get(proto::Language language) const;

  // Every language, in enum order.
  std::vector<const LanguageSpec*> All() const;

 private:
  std::map<proto::Language, LanguageSpec> specs_;
  std::map<std::string, proto::Language> ids_;
};

// Returns the name of the first public class declared in Java code, or an
// empty string.
std::string FindJavaPublicClass(const std::string& code);

}  // namespace manager

#endif
