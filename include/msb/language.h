#ifndef INCLUDE_MSB_LANGUAGE_H_
#define INCLUDE_MSB_LANGUAGE_H_

#include <memory>
#include <string>

namespace msb {

// What a sandbox needs to know about the language it runs.
// Adding a language only requires a new subclass.
class Language {
 public:
  virtual ~Language() = default;
  // image used by Sandbox::Start when none is given
  virtual std::string DefaultImage() const = 0;
  // value of "language" in sandbox.repl.run
  virtual std::string Tag() const = 0;
};

class PythonLanguage : public Language {
 public:
  std::string DefaultImage() const override { return "appcypher/msb-python"; }
  std::string Tag() const override { return "python"; }
};

class NodeLanguage : public Language {
 public:
  std::string DefaultImage() const override { return "appcypher/msb-node"; }
  std::string Tag() const override { return "javascript"; }
};

std::shared_ptr<const Language> Python();
std::shared_ptr<const Language> Node();

// "python", "python3", "node", "javascript", "js"; nullptr if unknown
std::shared_ptr<const Language> LanguageFromName(const std::string&);

} // namespace msb

#endif  // INCLUDE_MSB_LANGUAGE_H_
