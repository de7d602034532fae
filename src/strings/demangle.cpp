/***
 * Name: terse::strings::Demangle
 * Purpose: Turn a typeid name into readable C++ spelling.
 * Inputs: mangled (typeid(T).name())
 * Outputs: Demangled name, or the input when demangling fails
 * Theory of Operation: abi::__cxa_demangle allocates with malloc; ownership is
 *   taken by a unique_ptr with free as the deleter.
 */
#include "terse/strings/type_name.h"

#include <cstdlib>
#include <memory>

#include <cxxabi.h>

namespace terse::strings {

std::string Demangle(const char* mangled) {
  if (mangled == nullptr) {
    return std::string();
  }
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
  if (status != 0 || !demangled) {
    return std::string(mangled);
  }
  return std::string(demangled.get());
}

}  // namespace terse::strings
