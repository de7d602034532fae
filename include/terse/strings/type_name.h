/***
 * Name: terse::strings (type names)
 * Purpose: Human-readable names of C++ types for printing and diagnostics.
 * Inputs: Template type or a value of that type
 * Outputs: Demangled type name
 * Theory of Operation: typeid names are demangled through the Itanium C++ ABI
 *   runtime; when demangling fails the raw typeid name is returned.
 */
#pragma once

#include <iostream>
#include <ostream>
#include <string>
#include <typeinfo>

namespace terse {
namespace strings {

std::string Demangle(const char* mangled);

template <typename T>
std::string TypeName() {
  return Demangle(typeid(T).name());
}

template <typename T>
std::string TypeNameOf(const T& /*value*/) {
  return TypeName<T>();
}

/*** PrintType: write the value's type name and a newline. */
template <typename T>
void PrintType(const T& value, std::ostream& out = std::cout) {
  out << TypeNameOf(value) << '\n';
}

}  // namespace strings
}  // namespace terse
