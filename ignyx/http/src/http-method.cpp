#include "ignyx/http-method.hpp"

#include <string>

namespace ignyx::http {

std::string MethodBmpToStr(MethodBmp methods) {
  std::string out;
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (IsMethodSet(methods, MethodFromIdx(idx))) {
      if (!out.empty()) {
        out.append(", ");
      }
      out.append(kMethodStrings[idx]);
    }
  }
  return out;
}

}  // namespace ignyx::http
