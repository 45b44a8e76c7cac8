#include <msb/language.h>

namespace msb {

std::shared_ptr<const Language> Python() {
  static const std::shared_ptr<const Language> kPython = std::make_shared<PythonLanguage>();
  return kPython;
}

std::shared_ptr<const Language> Node() {
  static const std::shared_ptr<const Language> kNode = std::make_shared<NodeLanguage>();
  return kNode;
}

std::shared_ptr<const Language> LanguageFromName(const std::string& name) {
  if (name == "python" || name == "python3") return Python();
  if (name == "node" || name == "javascript" || name == "js") return Node();
  return nullptr;
}

} // namespace msb
