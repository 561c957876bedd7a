#include "ignyx/demangle.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

namespace ignyx {

std::string DemangledName(const std::type_info& typeInfo) {
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(abi::__cxa_demangle(typeInfo.name(), nullptr, nullptr, &status),
                                                        &std::free);
  if (status != 0 || demangled == nullptr) {
    return typeInfo.name();
  }
  return demangled.get();
}

}  // namespace ignyx
